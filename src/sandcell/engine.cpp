#include <sandcell/notebook.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <sandcell/utils.h>
#include <sandcell/workspace.h>
#include <sandcell/source_scan.h>
#include "utils.h"

namespace {

using nlohmann::json;

constexpr char kReplDir[] = "/repl";

// dedupe by text; the first contributor owns a fragment
void AppendFragments(std::vector<SourceFragment>& list, const std::vector<std::string>& codes,
                     const std::string& cell_id) {
  for (auto& code : codes) {
    bool found = std::any_of(list.begin(), list.end(),
                             [&](const SourceFragment& x) { return x.code == code; });
    if (!found) list.push_back({code, cell_id});
  }
}

json FragmentCodes(const std::vector<SourceFragment>& list) {
  json ret = json::array();
  for (auto& i : list) ret.push_back(i.code);
  return ret;
}

// hand fragments of a removed cell to another cell containing the same text,
// drop the rest
void ReleaseFragments(std::vector<SourceFragment>& list, const std::string& cell_id,
                      const std::vector<std::pair<std::string, std::vector<std::string>>>& owners) {
  std::vector<SourceFragment> ret;
  for (auto& fragment : list) {
    if (fragment.cell_id != cell_id) {
      ret.push_back(std::move(fragment));
      continue;
    }
    for (auto& [id, codes] : owners) {
      if (std::find(codes.begin(), codes.end(), fragment.code) != codes.end()) {
        ret.push_back({std::move(fragment.code), id});
        break;
      }
    }
  }
  list = std::move(ret);
}

CellOutput MakeOutput(OutputType type, const std::string& content) {
  return {type, content, "", NowMicros()};
}

class RunPathGuard {
  fs::path path_;
 public:
  explicit RunPathGuard(const fs::path& path) : path_(path) {}
  ~RunPathGuard() { RemoveAll(path_); }
};

} // namespace

Notebook NotebookEngine::Load_(const SessionKey& key) {
  fs::path file = NotebookFile(key);
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    Notebook ret;
    ret.key = key;
    ret.created_at = ret.updated_at = NowMicros();
    return ret;
  }
  auto content = ReadFile(file);
  if (!content) {
    throw NotebookError(NotebookErrorKind::PERSISTENCE, "Failed reading " + file.string());
  }
  json obj = json::parse(*content, nullptr, false);
  if (obj.is_discarded()) {
    throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, "Corrupted notebook " + file.string());
  }
  Notebook ret = Notebook::FromJson(obj);
  ret.key = key;
  return ret;
}

void NotebookEngine::Save_(Notebook& nb) {
  nb.updated_at = NowMicros();
  if (!CreateDirs(NotebookPath(nb.key), fs::perms::owner_all) ||
      !WriteFileAtomic(NotebookFile(nb.key), nb.ToJson().dump(1))) {
    throw NotebookError(NotebookErrorKind::PERSISTENCE,
                        "Failed saving notebook of " + nb.key.ToString());
  }
}

void NotebookEngine::Execute_(Notebook& nb, size_t index, long timeout) {
  Cell& cell = nb.cells[index];
  SourceScan scan = ScanSource(cell.code);
  const SessionKey& key = nb.key;

  long run_id = GetUniqueRunId();
  fs::path run_dir = SandboxRunPath(run_id);
  RunPathGuard guard(run_dir);
  if (!CreateDirs(run_dir, fs::perms::all)) {
    throw SandboxError("Failed creating run directory " + run_dir.string());
  }
  fs::path snapshot = NotebookSnapshotFile(key);
  bool has_snapshot = !nb.namespace_snapshot.empty() && fs::exists(snapshot);
  if (has_snapshot && !Copy(snapshot, run_dir / "snapshot.bin", fs::perms::all)) {
    throw SandboxError("Failed copying namespace snapshot of " + key.ToString());
  }

  size_t n_imports = nb.imports.size(), n_definitions = nb.definitions.size();
  AppendFragments(nb.imports, scan.imports, cell.id);
  AppendFragments(nb.definitions, scan.definitions, cell.id);
  json input = {
    {"code", cell.code},
    {"imports", FragmentCodes(nb.imports)},
    {"definitions", FragmentCodes(nb.definitions)},
    {"drop_names", nb.pending_drops},
    {"policy", SnapshotPolicyName(kSnapshotPolicy)},
    {"snapshot", has_snapshot ? "snapshot.bin" : ""},
  };
  if (!WriteFileAtomic(run_dir / "input.json", input.dump())) {
    nb.imports.resize(n_imports);
    nb.definitions.resize(n_definitions);
    throw SandboxError("Failed writing cell input for " + key.ToString());
  }

  SandboxRequest req;
  req.command = {NotebookExecProgram().string(), kReplDir};
  req.bind_mounts = {
    {run_dir.string(), kReplDir, false},
    {EnsureWorkspace(key).string(), kSandboxWorkspace, false},
    {internal::kDataDir.string(), internal::kDataDir.string(), true},
  };
  if (!kPythonPrefix.empty()) req.bind_mounts.push_back({kPythonPrefix, kPythonPrefix, true});
  req.timeout = timeout;
  req.isolate_network = tracker_.RequiredNetworkMode(key) == NetworkMode::NONE;
  req.isolate_pid = true;
  req.cwd = kSandboxWorkspace;
  req.env = {
    {"PATH", "/usr/local/bin:/usr/bin:/bin"},
    {"LANG", "C.UTF-8"},
    {"HOME", kSandboxWorkspace},
    {"TMPDIR", kReplDir},
    {"MPLBACKEND", "Agg"},
    {"MPLCONFIGDIR", std::string(kReplDir) + "/.matplotlib"},
    {"PYTHONDONTWRITEBYTECODE", "1"},
  };

  cell.state = CellState::RUNNING;
  cell.outputs.clear();
  cell.bound_names.clear();
  cell.execution_count = ++nb.execution_count;
  cell.executed_at = NowMicros();
  spdlog::info("Executing cell {} of {} (execution {}, network isolated: {})",
               index, key.ToString(), cell.execution_count, req.isolate_network);

  SandboxResult res;
  try {
    res = sandbox_.Run(req);
  } catch (const SandboxError& e) {
    cell.state = CellState::ERROR;
    cell.outputs.push_back(MakeOutput(OutputType::ERROR, std::string("Sandbox failure: ") + e.what()));
    cell.execution_time = NowMicros() - cell.executed_at;
    nb.imports.resize(n_imports);
    nb.definitions.resize(n_definitions);
    Save_(nb);
    throw;
  }
  cell.execution_time = NowMicros() - cell.executed_at;

  auto output_doc = ReadFile(run_dir / "output.json");
  if (res.timed_out) {
    cell.state = CellState::TIMEOUT;
    cell.outputs.push_back(MakeOutput(OutputType::ERROR,
        fmt::format("Cell execution timed out after {} seconds", (timeout + 999'999) / 1'000'000)));
  } else if (output_doc) {
    try {
      json output = json::parse(*output_doc);
      cell.state = output.at("state").get<std::string>() == "COMPLETED" ?
          CellState::COMPLETED : CellState::ERROR;
      for (auto& i : output.at("outputs")) {
        auto type = GetOutputType(i.at("type").get<std::string>());
        cell.outputs.push_back({type ? *type : OutputType::TEXT, i.at("content").get<std::string>(),
                                i.value("mime", ""), NowMicros()});
      }
      cell.bound_names = output.value("bound_names", std::vector<std::string>());
    } catch (const json::exception& e) {
      spdlog::warn("Malformed executor output of {}: {}", key.ToString(), e.what());
      cell.state = CellState::ERROR;
      cell.outputs.push_back(MakeOutput(OutputType::ERROR, "Malformed executor output"));
    }
    // the executor only writes a snapshot after the namespace was restored
    fs::path new_snapshot = run_dir / "snapshot.out.bin";
    if (fs::exists(new_snapshot)) {
      if (!CreateDirs(NotebookPath(key), fs::perms::owner_all) ||
          !Move(new_snapshot, snapshot, fs::perms::owner_read | fs::perms::owner_write)) {
        throw NotebookError(NotebookErrorKind::PERSISTENCE,
                            "Failed saving namespace snapshot of " + key.ToString());
      }
      nb.namespace_snapshot = snapshot.filename().string();
      nb.pending_drops.clear();
    }
  } else {
    cell.state = CellState::ERROR;
    cell.outputs.push_back(MakeOutput(OutputType::ERROR, res.err.empty() ?
        fmt::format("Executor exited with code {}", res.exit_code) : res.err));
  }
  if (cell.state != CellState::COMPLETED) {
    nb.imports.resize(n_imports);
    nb.definitions.resize(n_definitions);
  }
  spdlog::info("Cell {} of {} finished: {}", index, key.ToString(), CellStateName(cell.state));
}

Cell NotebookEngine::AddCell(const SessionKey& key, const std::string& code, bool execute,
                             long timeout, int position) {
  ScanSource(code);
  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  Notebook nb = Load_(key);
  if ((int)nb.cells.size() >= kMaxCells) {
    throw NotebookError(NotebookErrorKind::CELL_LIMIT,
                        fmt::format("Notebook already has {} cells", nb.cells.size()));
  }
  Cell cell;
  cell.id = RandomHex(12);
  cell.code = code;
  cell.created_at = NowMicros();
  size_t index = position < 0 || (size_t)position > nb.cells.size() ? nb.cells.size() : position;
  nb.cells.insert(nb.cells.begin() + index, std::move(cell));
  Save_(nb);
  if (execute) {
    Execute_(nb, index, timeout ? timeout : kCellTimeout);
    Save_(nb);
  }
  return nb.cells[index];
}

Cell NotebookEngine::ExecuteCell(const SessionKey& key, const std::string& ref, long timeout) {
  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  Notebook nb = Load_(key);
  size_t index = nb.Find(ref);
  Execute_(nb, index, timeout ? timeout : kCellTimeout);
  Save_(nb);
  return nb.cells[index];
}

std::string NotebookEngine::ShowNotebook(const SessionKey& key) {
  return Load(key).Render();
}

std::string NotebookEngine::ShowCell(const SessionKey& key, const std::string& ref) {
  Notebook nb = Load(key);
  size_t index = nb.Find(ref);
  return nb.cells[index].Render(index);
}

void NotebookEngine::DeleteCell(const SessionKey& key, const std::string& ref) {
  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  Notebook nb = Load_(key);
  size_t index = nb.Find(ref);
  Cell removed = std::move(nb.cells[index]);
  nb.cells.erase(nb.cells.begin() + index);

  std::vector<std::pair<std::string, std::vector<std::string>>> import_owners, definition_owners;
  for (auto& cell : nb.cells) {
    if (cell.state != CellState::COMPLETED) continue;
    try {
      SourceScan scan = ScanSource(cell.code);
      import_owners.emplace_back(cell.id, std::move(scan.imports));
      definition_owners.emplace_back(cell.id, std::move(scan.definitions));
    } catch (const NotebookError& e) {
      spdlog::debug("Skipping unparsable cell {}: {}", cell.id, e.what());
    }
  }
  ReleaseFragments(nb.imports, removed.id, import_owners);
  ReleaseFragments(nb.definitions, removed.id, definition_owners);

  for (auto& name : removed.bound_names) {
    bool still_bound = std::any_of(nb.cells.begin(), nb.cells.end(), [&](const Cell& x) {
      return std::find(x.bound_names.begin(), x.bound_names.end(), name) != x.bound_names.end();
    });
    if (!still_bound && std::find(nb.pending_drops.begin(), nb.pending_drops.end(), name) ==
        nb.pending_drops.end()) {
      nb.pending_drops.push_back(name);
    }
  }
  Save_(nb);
  spdlog::info("Deleted cell {} of {}; names to drop: {}", index, key.ToString(),
               nb.pending_drops.size());
}

void NotebookEngine::ClearNotebook(const SessionKey& key) {
  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  Notebook nb = Load_(key);
  nb.cells.clear();
  nb.imports.clear();
  nb.definitions.clear();
  nb.pending_drops.clear();
  nb.execution_count = 0;
  nb.namespace_snapshot.clear();
  std::error_code ec;
  fs::remove(NotebookSnapshotFile(key), ec);
  if (ec) {
    throw NotebookError(NotebookErrorKind::PERSISTENCE, "Failed removing namespace snapshot: " + ec.message());
  }
  Save_(nb);
}

fs::path NotebookEngine::ExportIpynb(const SessionKey& key, const fs::path& path) {
  Notebook nb = Load(key);
  if (nb.cells.empty()) {
    throw NotebookError(NotebookErrorKind::EMPTY_NOTEBOOK, "Notebook is empty, nothing to export");
  }
  if (!CreateDirs(path.parent_path()) || !WriteFileAtomic(path, nb.ToIpynb().dump(1))) {
    throw NotebookError(NotebookErrorKind::PERSISTENCE, "Failed writing " + path.string());
  }
  spdlog::info("Exported {} cells of {} to {}", nb.cells.size(), key.ToString(), path.c_str());
  return path;
}

void NotebookEngine::ImportIpynb(const SessionKey& key, const fs::path& path) {
  auto content = ReadFile(path);
  if (!content) {
    throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, "Cannot read " + path.string());
  }
  json obj = json::parse(*content, nullptr, false);
  if (obj.is_discarded()) {
    throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, path.string() + " is not valid JSON");
  }
  Notebook imported = Notebook::FromIpynb(obj);

  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  Notebook nb = Load_(key);
  nb.cells = std::move(imported.cells);
  nb.execution_count = imported.execution_count;
  nb.imports.clear();
  nb.definitions.clear();
  nb.pending_drops.clear();
  nb.namespace_snapshot.clear();
  std::error_code ec;
  fs::remove(NotebookSnapshotFile(key), ec);
  if (ec) spdlog::warn("Failed removing namespace snapshot of {}: {}", key.ToString(), ec.message());
  Save_(nb);
  spdlog::info("Imported {} cells into {}", nb.cells.size(), key.ToString());
}

Notebook NotebookEngine::Load(const SessionKey& key) {
  KeyedMutex::Lock lck(notebook_locks_, key.ToString());
  return Load_(key);
}
