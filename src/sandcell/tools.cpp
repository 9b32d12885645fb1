#include <sandcell/tools.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sandcell/utils.h>
#include <sandcell/workspace.h>

std::string Toolbox::SandboxExecute(const std::string& command, int timeout) {
  SessionKey key = CurrentSession();
  ExecResult res = scheduler_.Submit(key, [&]() {
    return containers_.ExecuteCommand(key, command, timeout * 1'000'000L, false);
  }).get();
  std::string ret = fmt::format("Exit code: {}", res.exit_code);
  if (!res.output.empty()) ret += "\n" + res.output;
  return ret;
}

Cell Toolbox::AddCell(const std::string& code, bool execute, int timeout) {
  SessionKey key = CurrentSession();
  return scheduler_.Submit(key, [&]() {
    return engine_.AddCell(key, code, execute, timeout * 1'000'000L);
  }).get();
}

Cell Toolbox::RerunCell(int index, int timeout) {
  SessionKey key = CurrentSession();
  return scheduler_.Submit(key, [&]() {
    return engine_.RerunCell(key, std::to_string(index), timeout * 1'000'000L);
  }).get();
}

std::string Toolbox::ShowNotebook() {
  SessionKey key = CurrentSession();
  return scheduler_.Submit(key, [&]() { return engine_.ShowNotebook(key); }).get();
}

std::string Toolbox::ShowCell(int index) {
  SessionKey key = CurrentSession();
  return scheduler_.Submit(key, [&]() {
    return engine_.ShowCell(key, std::to_string(index));
  }).get();
}

std::string Toolbox::DeleteCell(int index) {
  SessionKey key = CurrentSession();
  scheduler_.Submit(key, [&]() { engine_.DeleteCell(key, std::to_string(index)); }).get();
  return fmt::format("Deleted cell {}", index);
}

std::string Toolbox::ClearNotebook() {
  SessionKey key = CurrentSession();
  scheduler_.Submit(key, [&]() { engine_.ClearNotebook(key); }).get();
  return "Notebook cleared";
}

std::string Toolbox::ExportIpynb(const std::string& path) {
  SessionKey key = CurrentSession();
  std::string sandbox_path = path;
  if (sandbox_path.find('/') == std::string::npos) {
    sandbox_path = std::string(kSandboxWorkspace) + "/" + sandbox_path;
  }
  if (fs::path(sandbox_path).extension() != ".ipynb") sandbox_path += ".ipynb";
  fs::path host_path = SandboxToHostPath(key, sandbox_path);
  scheduler_.Submit(key, [&]() { engine_.ExportIpynb(key, host_path); }).get();
  return "Exported notebook to " + sandbox_path;
}

void Toolbox::RegisterDataset(const std::string& name, Sensitivity level) {
  tracker_.AddDataset(CurrentSession(), name, level);
}

bool Toolbox::IsAllowed(const std::vector<ToolPermission>& permissions) {
  SessionKey key = CurrentSession();
  for (auto permission : permissions) {
    if (permission == ToolPermission::CONNECT && tracker_.HasPrivateData(key)) {
      spdlog::info("Denied {} for {}: session holds private data",
                   ToolPermissionName(permission), key.ToString());
      return false;
    }
  }
  return true;
}
