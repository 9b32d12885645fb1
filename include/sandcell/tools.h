#ifndef INCLUDE_SANDCELL_TOOLS_H_
#define INCLUDE_SANDCELL_TOOLS_H_

#include <string>
#include <vector>

#include "notebook.h"
#include "container.h"
#include "scheduler.h"
#include "sensitivity.h"

#define ENUM_TOOL_PERMISSION_ \
  X(READ, "read") \
  X(WRITE, "write") \
  X(CONNECT, "connect")
enum class ToolPermission {
#define X(name, str) name,
  ENUM_TOOL_PERMISSION_
#undef X
};

// Agent-facing surface. Every call acts on CurrentSession() and is executed
// on the scheduler, so calls of one session are serialized.
class Toolbox {
  Scheduler& scheduler_;
  SensitivityTracker& tracker_;
  ContainerManager& containers_;
  NotebookEngine& engine_;
 public:
  Toolbox(Scheduler& scheduler, SensitivityTracker& tracker,
          ContainerManager& containers, NotebookEngine& engine) :
      scheduler_(scheduler), tracker_(tracker), containers_(containers), engine_(engine) {}

  // ephemeral; timeout in seconds, 0 for the profile default
  std::string SandboxExecute(const std::string& command, int timeout = 0);

  // timeouts in seconds, 0 for kCellTimeout
  Cell AddCell(const std::string& code, bool execute = true, int timeout = 0);
  // cells are addressed by 0-based index
  Cell RerunCell(int index, int timeout = 0);
  std::string ShowNotebook();
  std::string ShowCell(int index);
  std::string DeleteCell(int index);
  std::string ClearNotebook();
  // path inside the sandbox; bare names go under /workspace and get .ipynb
  std::string ExportIpynb(const std::string& path);

  // for data connectors
  void RegisterDataset(const std::string& name, Sensitivity level);
  // false if any of the permissions is currently denied for the session
  bool IsAllowed(const std::vector<ToolPermission>& permissions);
};

#endif  // INCLUDE_SANDCELL_TOOLS_H_
