#ifndef INCLUDE_SANDCELL_NOTEBOOK_H_
#define INCLUDE_SANDCELL_NOTEBOOK_H_

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include "paths.h"
#include "session.h"
#include "sandbox.h"
#include "sensitivity.h"

extern int kMaxCells;
extern long kCellTimeout; // us
extern std::string kPythonPrefix; // bound read-only into notebook sandboxes if set

#define ENUM_CELL_STATE_ \
  X(IDLE) \
  X(RUNNING) \
  X(COMPLETED) \
  X(ERROR) \
  X(TIMEOUT)
enum class CellState {
#define X(name) name,
  ENUM_CELL_STATE_
#undef X
};

#define ENUM_OUTPUT_TYPE_ \
  X(TEXT) \
  X(ERROR) \
  X(HTML) \
  X(IMAGE) \
  X(TABLE)
enum class OutputType {
#define X(name) name,
  ENUM_OUTPUT_TYPE_
#undef X
};

// what happens to a binding that cannot be serialized at the end of a cell
#define ENUM_SNAPSHOT_POLICY_ \
  X(DROP, "drop") \
  X(PLACEHOLDER, "placeholder") \
  X(FAIL, "fail")
enum class SnapshotPolicy {
#define X(name, str) name,
  ENUM_SNAPSHOT_POLICY_
#undef X
};
extern SnapshotPolicy kSnapshotPolicy;

#define ENUM_NOTEBOOK_ERROR_ \
  X(CELL_NOT_FOUND) \
  X(PARSE_ERROR) \
  X(CELL_LIMIT) \
  X(EMPTY_NOTEBOOK) \
  X(INVALID_DOCUMENT) \
  X(PERSISTENCE)
enum class NotebookErrorKind {
#define X(name) name,
  ENUM_NOTEBOOK_ERROR_
#undef X
};

// Caller misuse or storage failure; execution errors of cell code are
// recorded in the cell instead
class NotebookError : public std::runtime_error {
  NotebookErrorKind kind_;
 public:
  NotebookError(NotebookErrorKind kind, const std::string& msg);
  NotebookErrorKind Kind() const { return kind_; }
};

struct CellOutput {
  OutputType type;
  std::string content; // base64 for IMAGE
  std::string mime; // only for IMAGE
  int64_t timestamp; // UNIX timestamp, microseconds
};

class Cell {
 public:
  std::string id;
  std::string code;
  CellState state;
  std::vector<CellOutput> outputs;
  int execution_count; // 0 if never executed
  int64_t created_at; // UNIX timestamp, microseconds
  int64_t executed_at;
  int64_t execution_time; // us
  std::vector<std::string> bound_names; // top-level names bound by the last execution

  Cell() :
      state(CellState::IDLE),
      execution_count(0),
      created_at(0), executed_at(0), execution_time(0) {}

  nlohmann::json ToJson() const;
  static Cell FromJson(const nlohmann::json&);
  std::string Render(int index) const;
};

// an import statement or a top-level def/class block
struct SourceFragment {
  std::string code;
  std::string cell_id; // the cell that contributed it
};

class Notebook {
 public:
  SessionKey key;
  std::vector<Cell> cells;
  int execution_count;
  std::vector<SourceFragment> imports;
  std::vector<SourceFragment> definitions;
  std::string namespace_snapshot; // file name relative to the notebook directory; empty if none
  std::vector<std::string> pending_drops; // names to remove before the next execution
  int64_t created_at, updated_at;

  Notebook() : execution_count(0), created_at(0), updated_at(0) {}

  // index of a cell by 0-based number or id; throws NotebookError(CELL_NOT_FOUND)
  size_t Find(const std::string& ref) const;

  nlohmann::json ToJson() const;
  static Notebook FromJson(const nlohmann::json&);

  // nbformat 4.5; outputs keep their types for ImportIpynb
  nlohmann::json ToIpynb() const;
  static Notebook FromIpynb(const nlohmann::json&);

  std::string Render() const;
};

class NotebookEngine {
  ProcessSandbox& sandbox_;
  SensitivityTracker& tracker_;
  KeyedMutex notebook_locks_;

  Notebook Load_(const SessionKey&);
  void Save_(Notebook&);
  void Execute_(Notebook&, size_t index, long timeout);
 public:
  NotebookEngine(ProcessSandbox& sandbox, SensitivityTracker& tracker) :
      sandbox_(sandbox), tracker_(tracker) {}

  // position < 0 appends; timeout in us, 0 uses kCellTimeout
  Cell AddCell(const SessionKey&, const std::string& code, bool execute = true,
               long timeout = 0, int position = -1);
  Cell ExecuteCell(const SessionKey&, const std::string& ref, long timeout = 0);
  Cell RerunCell(const SessionKey& key, const std::string& ref, long timeout = 0) {
    return ExecuteCell(key, ref, timeout);
  }
  std::string ShowNotebook(const SessionKey&);
  std::string ShowCell(const SessionKey&, const std::string& ref);
  void DeleteCell(const SessionKey&, const std::string& ref);
  void ClearNotebook(const SessionKey&);
  // host path; written atomically
  fs::path ExportIpynb(const SessionKey&, const fs::path& path);
  // Replaces the notebook's cells; nothing is executed, so the namespace starts empty
  void ImportIpynb(const SessionKey&, const fs::path& path);
  Notebook Load(const SessionKey&);
};

#endif  // INCLUDE_SANDCELL_NOTEBOOK_H_
