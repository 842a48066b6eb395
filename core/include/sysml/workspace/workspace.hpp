// sysml/workspace/workspace.hpp - Multi-file semantic workspace
//
// The Workspace owns the files of a project and publishes immutable semantic
// models. Every population cycle builds a fresh model and publishes it only
// when the cycle completes; readers hold a WorkspaceView of one published
// model and never observe a half-built one.
//
// Threading: mutations and populate_all() must be serialized by the caller.
// view(), generation(), is_current() and cancel_pending() may be called from
// any thread.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml/basic/cancellation.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/source_manager.hpp"
#include "sysml/sema/semantic_model.hpp"
#include "sysml/syntax/frontend.hpp"
#include "sysml/workspace/dependency_graph.hpp"

namespace sysml
{

// ============================================================================
// File state
// ============================================================================

enum class FileState : uint8_t {
  Unloaded,   ///< Registered, text not read yet
  Parsed,     ///< Text parsed; not part of the published model
  Populated,  ///< Declared into a model that is still being analyzed
  Validated,  ///< Part of the published, analyzed model
};

[[nodiscard]] std::string_view to_string(FileState s) noexcept;

struct FileInfo
{
  FileId id;
  std::filesystem::path path;
  FileState state = FileState::Unloaded;
  bool is_stdlib = false;
};

// ============================================================================
// Results
// ============================================================================

enum class PopulateStatus : uint8_t {
  Success,
  Partial,    ///< Published, but some files could not be read or parsed
  Cancelled,  ///< Nothing published; the previous model stays visible
};

struct PopulateResult
{
  PopulateStatus status = PopulateStatus::Success;
  uint64_t generation = 0;  ///< Generation of the visible model afterwards
  size_t files_populated = 0;
  std::vector<FileId> failed_files;

  [[nodiscard]] bool ok() const noexcept { return status == PopulateStatus::Success; }
  [[nodiscard]] bool cancelled() const noexcept { return status == PopulateStatus::Cancelled; }
};

/// Generation captured when a read-only request was dispatched.
struct RequestTicket
{
  uint64_t generation = 0;
};

// ============================================================================
// Read-only views
// ============================================================================

/// Copy of a symbol, safe to keep after the model it came from is replaced.
struct SymbolView
{
  SymbolKind kind = SymbolKind::Usage;
  std::string qualified_name;
  std::string simple_name;
  std::string keyword;  ///< "part def", "package", ...
  FileId file;
  SourceRange span;
  SourceRange decl_range;
  Visibility visibility = Visibility::Public;
  SemanticRole role = SemanticRole::Unknown;
  Direction direction = Direction::None;
  bool is_abstract = false;
  bool is_variation = false;
  std::optional<std::string> type;  ///< Typing target, if any
  std::string alias_target;
  std::string documentation;
};

/// Symbol under a cursor and the text range that named it.
struct SymbolHit
{
  SymbolView symbol;
  SourceRange range;
  bool is_reference = false;
};

struct ReferenceLocation
{
  FileId file;
  SourceRange range;
  RelationshipKind kind = RelationshipKind::Typing;
  std::string source;  ///< Qualified name of the referencing element
};

/// Published state of one population cycle.
struct ModelSnapshot
{
  uint64_t generation = 0;
  SemanticModel model;
  DependencyGraph dependencies;
  std::vector<FileInfo> files;
  std::map<FileId, std::shared_ptr<const ParsedFile>> parsed;
};

/**
 * Read-only access to one published model.
 *
 * Cheap to copy. Everything it returns is a value; nothing refers back into
 * the workspace.
 */
class WorkspaceView
{
public:
  explicit WorkspaceView(std::shared_ptr<const ModelSnapshot> snapshot)
  : snapshot_(std::move(snapshot))
  {
  }

  [[nodiscard]] uint64_t generation() const noexcept { return snapshot_->generation; }

  // Symbols
  [[nodiscard]] std::optional<SymbolView> lookup_qualified(std::string_view name) const;
  [[nodiscard]] std::optional<SymbolView> lookup_simple(
    std::string_view name, FileId file, uint32_t offset) const;
  [[nodiscard]] std::vector<SymbolView> symbols_in_file(FileId file) const;
  [[nodiscard]] std::vector<SymbolView> all_symbols() const;
  [[nodiscard]] size_t symbol_count() const noexcept;

  /**
   * Symbols nameable by a simple name at a byte offset.
   *
   * Members and import bindings of every enclosing scope, innermost scope
   * first; a name shadowed by an inner scope is listed once. Ambiguous
   * bindings are left out.
   */
  [[nodiscard]] std::vector<SymbolView> visible_at(FileId file, uint32_t offset) const;

  /// Public members of the namespace `reference` names when written at an offset.
  [[nodiscard]] std::vector<SymbolView> members_of(
    std::string_view reference, FileId file, uint32_t offset) const;

  /// Symbol declared at, or referenced at, a byte offset.
  [[nodiscard]] std::optional<SymbolView> symbol_at(FileId file, uint32_t offset) const;
  [[nodiscard]] std::optional<SymbolHit> hit_at(FileId file, uint32_t offset) const;

  // Relationships
  [[nodiscard]] std::vector<std::string> specializations_of(std::string_view name) const;
  [[nodiscard]] bool is_specialization(std::string_view a, std::string_view b) const;
  [[nodiscard]] std::vector<std::string> satisfactions_of(std::string_view requirement) const;
  [[nodiscard]] std::vector<ReferenceLocation> references_to(std::string_view name) const;

  // Files
  [[nodiscard]] std::vector<Diagnostic> diagnostics(FileId file) const;
  [[nodiscard]] std::vector<Diagnostic> all_diagnostics() const;
  [[nodiscard]] std::vector<FileId> affected_files(FileId file) const;
  [[nodiscard]] const std::vector<FileInfo> & files() const noexcept { return snapshot_->files; }

  [[nodiscard]] const ModelSnapshot & snapshot() const noexcept { return *snapshot_; }

private:
  [[nodiscard]] SymbolView make_view(const Symbol & sym) const;

  std::shared_ptr<const ModelSnapshot> snapshot_;
};

// ============================================================================
// Workspace
// ============================================================================

class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;
  Workspace(Workspace &&) noexcept;
  Workspace & operator=(Workspace &&) noexcept;

  // ----------------------------------------------------------------------
  // Mutation
  // ----------------------------------------------------------------------

  /// Register a file to be read from disk by the next populate_all().
  FileId add_file(const std::filesystem::path & path);

  /// Register (or replace) a file with in-memory text and repopulate.
  PopulateResult add_file(const std::filesystem::path & path, std::string text);
  PopulateResult update_file(const std::filesystem::path & path, std::string text);

  /// Forget a file and repopulate. Unknown paths are a no-op.
  PopulateResult remove_file(const std::filesystem::path & path);

  /**
   * Register every model file under `dir` as standard library.
   *
   * Only the first call has an effect. Returns the number of files added.
   */
  size_t load_stdlib(const std::filesystem::path & dir);

  /**
   * Rebuild the model from every registered file and publish it.
   *
   * Without a token, the cycle is cancelled when the generation moves (a
   * mutation, or cancel_pending()) before it completes.
   */
  PopulateResult populate_all(std::optional<CancellationToken> cancel = std::nullopt);

  /// Cancel a running population cycle from another thread.
  void cancel_pending() noexcept;

  // ----------------------------------------------------------------------
  // Queries
  // ----------------------------------------------------------------------

  [[nodiscard]] WorkspaceView view() const;

  [[nodiscard]] uint64_t generation() const noexcept;
  [[nodiscard]] RequestTicket begin_request() const noexcept;
  [[nodiscard]] bool is_current(RequestTicket ticket) const noexcept;

  [[nodiscard]] std::optional<FileId> find_file(const std::filesystem::path & path) const;
  [[nodiscard]] std::optional<FileState> file_state(const std::filesystem::path & path) const;
  [[nodiscard]] std::vector<FileInfo> files() const;
  [[nodiscard]] bool stdlib_loaded() const noexcept;

  /// Text and line tables of every registered file.
  [[nodiscard]] const SourceRegistry & sources() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sysml
