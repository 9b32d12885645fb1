#include <sandcell/config.h>

#include <fstream>

#include <tortellini.hh>
#include <sandcell/paths.h>
#include <sandcell/utils.h>
#include <sandcell/notebook.h>
#include <sandcell/container.h>
#include <sandcell/scheduler.h>
#include "utils.h"

SandboxBackend kSandboxBackend = SandboxBackend::NAMESPACE;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;

  std::string box_root = ini[""]["box_root"] | "";
  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string private_data_root = ini[""]["private_data_root"] | "";
  std::string notebook_root = ini[""]["notebook_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  if (private_data_root.size()) kPrivateDataRoot = private_data_root;
  if (notebook_root.size()) kNotebookRoot = notebook_root;

  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  if (std::string sandbox = ini[""]["sandbox"] | ""; sandbox.size()) {
    auto backend = GetSandboxBackend(sandbox);
    if (!backend) throw std::invalid_argument("unknown sandbox backend: " + sandbox);
    kSandboxBackend = *backend;
  }
  kSandboxUid = ini[""]["sandbox_uid"] | kSandboxUid;
  kMaxRSS = (ini[""]["max_rss_per_task_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = (ini[""]["max_output_per_task_mb"] | (kMaxOutput / 1024)) * 1024;
  kMaxProcs = ini[""]["max_procs"] | kMaxProcs;

  kCellTimeout = (ini[""]["cell_timeout"] | (kCellTimeout / 1'000'000)) * 1'000'000;
  kContainerProfile.command_timeout =
      (ini[""]["command_timeout"] | (kContainerProfile.command_timeout / 1'000'000)) * 1'000'000;
  kMaxCells = ini[""]["max_cells"] | kMaxCells;
  if (std::string policy = ini[""]["snapshot_policy"] | ""; policy.size()) {
    auto val = GetSnapshotPolicy(policy);
    if (!val) throw std::invalid_argument("unknown snapshot policy: " + policy);
    kSnapshotPolicy = *val;
  }
  kPythonPrefix = ini[""]["python_prefix"] | kPythonPrefix;

  kDockerSocket = ini[""]["docker_socket"] | kDockerSocket;
  kDockerApiVersion = ini[""]["docker_api_version"] | kDockerApiVersion;
  kContainerProfile.image = ini[""]["image"] | kContainerProfile.image;
  kContainerProfile.cpu_limit = ini[""]["cpu_limit"] | kContainerProfile.cpu_limit;
  kContainerProfile.memory_limit = ini[""]["memory_limit"] | kContainerProfile.memory_limit;
  ParseMemoryLimit(kContainerProfile.memory_limit);
  kContainerProfile.container_prefix = ini[""]["container_prefix"] | kContainerProfile.container_prefix;
  kContainerProfile.user = ini[""]["container_user"] | kContainerProfile.user;
  if (std::string mounts = ini[""]["read_only_mounts"] | ""; mounts.size()) {
    kContainerProfile.read_only_mounts.clear();
    for (auto& [host, target] : ParsePairs(mounts)) {
      kContainerProfile.read_only_mounts[host] = target;
    }
  }

  if (kMaxParallel < 1 || kMaxCells < 1 || kCellTimeout <= 0 ||
      kContainerProfile.command_timeout <= 0 || kContainerProfile.cpu_limit <= 0) {
    throw std::invalid_argument("parallel, max_cells, timeouts and cpu_limit must be positive");
  }
  return true;
}
