// sysml/workspace/workspace.cpp - Multi-file semantic workspace
#include "sysml/workspace/workspace.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>

#include "sysml/basic/diagnostic_codes.hpp"
#include "sysml/workspace/stdlib_loader.hpp"

namespace fs = std::filesystem;

namespace sysml
{

std::string_view to_string(FileState s) noexcept
{
  switch (s) {
    case FileState::Unloaded:
      return "unloaded";
    case FileState::Parsed:
      return "parsed";
    case FileState::Populated:
      return "populated";
    case FileState::Validated:
      return "validated";
  }
  return "unloaded";
}

namespace
{

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

}  // namespace

// ============================================================================
// Impl
// ============================================================================

struct Workspace::Impl
{
  struct FileRecord
  {
    FileId id;
    fs::path path;
    FileState state = FileState::Unloaded;
    bool is_stdlib = false;
    bool has_text = false;
    std::shared_ptr<const ParsedFile> parsed;
  };

  SourceRegistry sources;
  std::map<FileId, FileRecord> files;
  bool stdlib_loaded = false;

  std::atomic<uint64_t> generation{0};
  mutable std::mutex snapshot_mutex;
  std::shared_ptr<const ModelSnapshot> snapshot = std::make_shared<const ModelSnapshot>();

  void bump() noexcept { generation.fetch_add(1, std::memory_order_acq_rel); }

  FileRecord * register_file(const fs::path & path, std::string text, bool has_text)
  {
    const FileId id = sources.register_file(path, std::move(text));
    if (!id.is_valid()) {
      return nullptr;
    }
    FileRecord & rec = files[id];
    rec.id = id;
    rec.path = sources.get_path(id);
    rec.has_text = has_text;
    rec.parsed.reset();
    rec.state = FileState::Unloaded;
    if (has_text) {
      rec.parsed = parse_file(sources, id);
      rec.state = FileState::Parsed;
    }
    return &rec;
  }

  FileRecord * find(const fs::path & path)
  {
    auto id = sources.find_by_path(path);
    if (!id) {
      return nullptr;
    }
    auto it = files.find(*id);
    return it != files.end() ? &it->second : nullptr;
  }

  /// Standard library first, then project files, each in path order.
  std::vector<FileRecord *> population_order()
  {
    std::vector<FileRecord *> order;
    order.reserve(files.size());
    for (auto & [id, rec] : files) {
      order.push_back(&rec);
    }
    std::stable_sort(order.begin(), order.end(), [](const FileRecord * a, const FileRecord * b) {
      if (a->is_stdlib != b->is_stdlib) {
        return a->is_stdlib;
      }
      return a->path < b->path;
    });
    return order;
  }

  /// Read an unloaded file. On failure the IO001 holder is returned instead.
  std::shared_ptr<const ParsedFile> load(FileRecord & rec)
  {
    if (!rec.has_text) {
      auto text = read_file(rec.path);
      if (!text) {
        auto failed = std::make_shared<ParsedFile>();
        failed->file_id = rec.id;
        failed->diags
          .report_error(SourceRange(rec.id, 0, 0), "cannot read file '" + rec.path.string() + "'")
          .with_code(diag_codes::k_read_failure);
        return failed;
      }
      sources.update_content(rec.id, std::move(*text));
      rec.has_text = true;
      rec.parsed.reset();
    }
    if (!rec.parsed) {
      rec.parsed = parse_file(sources, rec.id);
      rec.state = FileState::Parsed;
    }
    return rec.parsed;
  }

  std::shared_ptr<const ModelSnapshot> current() const
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return snapshot;
  }

  void publish(std::shared_ptr<const ModelSnapshot> next)
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    snapshot = std::move(next);
  }
};

// ============================================================================
// Construction
// ============================================================================

Workspace::Workspace() : impl_(std::make_unique<Impl>()) {}

Workspace::~Workspace() = default;

Workspace::Workspace(Workspace &&) noexcept = default;

Workspace & Workspace::operator=(Workspace &&) noexcept = default;

// ============================================================================
// Mutation
// ============================================================================

FileId Workspace::add_file(const fs::path & path)
{
  Impl::FileRecord * rec = impl_->register_file(path, std::string{}, false);
  if (rec == nullptr) {
    return FileId::invalid();
  }
  impl_->bump();
  return rec->id;
}

PopulateResult Workspace::add_file(const fs::path & path, std::string text)
{
  return update_file(path, std::move(text));
}

PopulateResult Workspace::update_file(const fs::path & path, std::string text)
{
  const bool is_stdlib = [&] {
    const Impl::FileRecord * existing = impl_->find(path);
    return existing != nullptr && existing->is_stdlib;
  }();

  Impl::FileRecord * rec = impl_->register_file(path, std::move(text), true);
  if (rec != nullptr) {
    rec->is_stdlib = is_stdlib;
  }
  impl_->bump();
  return populate_all();
}

PopulateResult Workspace::remove_file(const fs::path & path)
{
  Impl::FileRecord * rec = impl_->find(path);
  if (rec == nullptr) {
    PopulateResult result;
    result.generation = generation();
    return result;
  }

  impl_->files.erase(rec->id);
  impl_->bump();
  return populate_all();
}

size_t Workspace::load_stdlib(const fs::path & dir)
{
  if (impl_->stdlib_loaded) {
    return 0;
  }
  impl_->stdlib_loaded = true;

  size_t added = 0;
  for (const auto & path : collect_model_files(dir)) {
    Impl::FileRecord * rec = impl_->register_file(path, std::string{}, false);
    if (rec != nullptr) {
      rec->is_stdlib = true;
      ++added;
    }
  }
  if (added > 0) {
    impl_->bump();
  }
  return added;
}

void Workspace::cancel_pending() noexcept { impl_->bump(); }

PopulateResult Workspace::populate_all(std::optional<CancellationToken> cancel)
{
  const uint64_t start = impl_->generation.load(std::memory_order_acquire);
  const CancellationToken token = cancel.value_or(CancellationToken(&impl_->generation, start));

  PopulateResult result;
  auto cancelled = [&]() {
    result.status = PopulateStatus::Cancelled;
    result.generation = impl_->current()->generation;
    result.files_populated = 0;
    result.failed_files.clear();
    return result;
  };

  auto next = std::make_shared<ModelSnapshot>();
  std::map<FileId, FileState> states;
  const auto order = impl_->population_order();

  // Read and parse
  for (Impl::FileRecord * rec : order) {
    if (token.is_cancelled()) {
      return cancelled();
    }
    auto parsed = impl_->load(*rec);
    next->parsed[rec->id] = parsed;
    states[rec->id] = rec->has_text ? FileState::Parsed : FileState::Unloaded;
  }

  // Populate; a file that cannot be read or parsed is skipped, never fatal.
  for (Impl::FileRecord * rec : order) {
    if (token.is_cancelled()) {
      return cancelled();
    }
    const auto & parsed = next->parsed[rec->id];
    if (!rec->has_text || parsed->unit == nullptr || parsed->has_errors()) {
      result.failed_files.push_back(rec->id);
      continue;
    }
    (void)populate_file(next->model, *parsed->unit, rec->id);
    states[rec->id] = FileState::Populated;
    ++result.files_populated;
  }

  if (!resolve_and_analyze(next->model, token)) {
    return cancelled();
  }

  // File dependencies
  const SymbolTable & symbols = next->model.symbols;
  for (const auto & ref : next->model.references) {
    for (const SymbolId target : {ref.resolved, ref.resolved_subject}) {
      if (target != k_invalid_symbol) {
        next->dependencies.add_dependency(ref.file, symbols.get(target).source_file);
      }
    }
  }
  for (const auto & d : next->model.imports) {
    if (d.resolved != k_invalid_symbol) {
      next->dependencies.add_dependency(d.file, symbols.get(d.resolved).source_file);
    }
  }

  if (token.is_cancelled()) {
    return cancelled();
  }

  // Commit
  for (Impl::FileRecord * rec : order) {
    FileState & state = states[rec->id];
    if (state == FileState::Populated) {
      state = FileState::Validated;
    }
    rec->state = state;
    next->files.push_back(FileInfo{rec->id, rec->path, state, rec->is_stdlib});
  }

  const uint64_t published = impl_->generation.fetch_add(1, std::memory_order_acq_rel) + 1;
  next->generation = published;
  impl_->publish(std::move(next));

  result.generation = published;
  result.status = result.failed_files.empty() ? PopulateStatus::Success : PopulateStatus::Partial;
  return result;
}

// ============================================================================
// Queries
// ============================================================================

WorkspaceView Workspace::view() const { return WorkspaceView(impl_->current()); }

uint64_t Workspace::generation() const noexcept
{
  return impl_->generation.load(std::memory_order_acquire);
}

RequestTicket Workspace::begin_request() const noexcept { return RequestTicket{generation()}; }

bool Workspace::is_current(RequestTicket ticket) const noexcept
{
  return ticket.generation == generation();
}

std::optional<FileId> Workspace::find_file(const fs::path & path) const
{
  auto id = impl_->sources.find_by_path(path);
  if (!id || impl_->files.find(*id) == impl_->files.end()) {
    return std::nullopt;
  }
  return id;
}

std::optional<FileState> Workspace::file_state(const fs::path & path) const
{
  auto id = find_file(path);
  if (!id) {
    return std::nullopt;
  }
  return impl_->files.at(*id).state;
}

std::vector<FileInfo> Workspace::files() const
{
  std::vector<FileInfo> out;
  out.reserve(impl_->files.size());
  for (const auto & [id, rec] : impl_->files) {
    out.push_back(FileInfo{id, rec.path, rec.state, rec.is_stdlib});
  }
  return out;
}

bool Workspace::stdlib_loaded() const noexcept { return impl_->stdlib_loaded; }

const SourceRegistry & Workspace::sources() const noexcept { return impl_->sources; }

}  // namespace sysml
