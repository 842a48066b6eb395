#pragma once

#include <array>
#include <string_view>
#include <type_traits>
#include <utility>

#include "sysml/ast/ast_enums.hpp"

namespace sysml::syntax
{

// Single-word element keywords. Two-word kinds ("use case", "analysis case",
// "verification case") are recognized by the parser from their first word.
inline constexpr std::array<std::pair<std::string_view, ElementKind>, 33> k_element_keywords = {{
  {"part", ElementKind::Part},
  {"item", ElementKind::Item},
  {"port", ElementKind::Port},
  {"attribute", ElementKind::Attribute},
  {"action", ElementKind::Action},
  {"state", ElementKind::State},
  {"requirement", ElementKind::Requirement},
  {"constraint", ElementKind::Constraint},
  {"connection", ElementKind::Connection},
  {"interface", ElementKind::Interface},
  {"allocation", ElementKind::Allocation},
  {"case", ElementKind::Case},
  {"concern", ElementKind::Concern},
  {"view", ElementKind::View},
  {"viewpoint", ElementKind::Viewpoint},
  {"rendering", ElementKind::Rendering},
  {"metadata", ElementKind::Metadata},
  {"occurrence", ElementKind::Occurrence},
  {"flow", ElementKind::Flow},
  {"enum", ElementKind::Enum},
  {"calc", ElementKind::Calc},
  {"ref", ElementKind::Ref},
  {"class", ElementKind::Class},
  {"classifier", ElementKind::Classifier},
  {"datatype", ElementKind::Datatype},
  {"struct", ElementKind::Struct},
  {"assoc", ElementKind::Assoc},
  {"behavior", ElementKind::Behavior},
  {"function", ElementKind::Function},
  {"predicate", ElementKind::Predicate},
  {"metaclass", ElementKind::Metaclass},
  {"type", ElementKind::Type},
  {"feature", ElementKind::Feature},
}};

// Usage-only keywords that declare a feature of the enclosing element.
inline constexpr std::array<std::pair<std::string_view, ElementKind>, 5> k_member_feature_keywords = {{
  {"subject", ElementKind::Ref},
  {"actor", ElementKind::Part},
  {"stakeholder", ElementKind::Part},
  {"return", ElementKind::Ref},
  {"objective", ElementKind::Requirement},
}};

// Behavioral and structural statements that carry no declarations relevant
// to the semantic model. The parser skips them without diagnostics.
inline constexpr std::array<std::string_view, 28> k_skipped_statement_keywords = {
  "entry",  "exit",       "do",      "then",    "first",   "transition", "accept",
  "send",   "succession", "bind",    "connect", "message", "assert",     "require",
  "assume", "if",         "else",    "while",   "for",     "merge",      "decide",
  "join",   "fork",       "frame",   "expose",  "render",  "dependency", "filter",
};

// Keywords that start a member but are neither element kinds nor skipped
// statements.
inline constexpr std::array<std::string_view, 21> k_member_keywords = {
  "package",  "library", "standard", "import",   "alias",   "doc",     "comment",
  "public",   "private", "protected", "abstract", "variation", "readonly", "derived",
  "end",      "in",      "out",      "inout",    "satisfy", "perform", "exhibit",
};

// Words that may follow a name in a declaration and must not be taken as one.
inline constexpr std::array<std::string_view, 10> k_relationship_keywords = {
  "specializes", "subsets", "redefines", "references", "defined",
  "typed",       "default", "ordered",   "nonunique",  "by",
};

[[nodiscard]] constexpr bool contains_keyword(
  const auto & table, std::string_view word) noexcept
{
  for (const auto & entry : table) {
    if constexpr (std::is_same_v<std::decay_t<decltype(entry)>, std::string_view>) {
      if (entry == word) return true;
    } else {
      if (entry.first == word) return true;
    }
  }
  return false;
}

}  // namespace sysml::syntax
