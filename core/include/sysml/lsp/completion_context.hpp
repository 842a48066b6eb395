#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sysml::lsp
{

enum class CompletionContextKind {
  MemberStart,      // Where a member may begin: keywords
  TypeReference,    // After `:`, `:>`, `:>>`, `::>` or a relationship keyword
  QualifiedMember,  // After `Q::`
  ImportPath,       // First segment of an import target
};

struct CompletionContext
{
  CompletionContextKind kind = CompletionContextKind::MemberStart;

  // QualifiedMember: the qualifier as written, without the trailing `::`.
  std::optional<std::string> qualifier;

  // Partial word under the cursor that an accepted item replaces.
  uint32_t replace_begin = 0;
  uint32_t replace_end = 0;
};

// Classify the completion context at a byte offset from the tokens before it.
// Returns nullopt inside comments and strings, and where a new name is being
// declared.
std::optional<CompletionContext> classify_completion_context(
  std::string_view text, uint32_t byte_offset);

}  // namespace sysml::lsp
