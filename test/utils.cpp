#include "utils.h"

#include <unistd.h>
#include <atomic>
#include <algorithm>

namespace {

std::atomic_int scratch_seq = 0;

} // namespace

fs::path TestRoot() {
  return fs::temp_directory_path() / ("sandcell_test_" + std::to_string(getpid()));
}

void ScratchTest::SetUp() {
  root = TestRoot() / std::to_string(++scratch_seq);
  kBoxRoot = root / "box";
  kWorkspaceRoot = root / "workspaces";
  kPrivateDataRoot = root / "private_data";
  kNotebookRoot = root / "notebooks";
  fs::create_directories(root);
}

void ScratchTest::TearDown() {
  fs::remove_all(root);
}

std::string FakeRuntime::Create(const std::string& name, const ContainerConfig& config,
                                const fs::path& data_dir) {
  std::lock_guard<std::mutex> lck(mtx);
  if (fail_create) throw ContainerError(ContainerErrorKind::IMAGE_NOT_FOUND, config.image);
  std::string id = "container" + std::to_string(++created);
  containers[id] = {name, config, data_dir};
  history.push_back(config);
  return id;
}

ExecResult FakeRuntime::Exec(const std::string& id, const std::vector<std::string>& command,
                             const std::string& workdir, long timeout) {
  SandboxRequest req;
  {
    std::lock_guard<std::mutex> lck(mtx);
    if (vanish) {
      containers.erase(id);
      vanish = false;
    }
    auto it = containers.find(id);
    if (it == containers.end()) throw ContainerError(ContainerErrorKind::CONTAINER_NOT_FOUND, id);
    req.bind_mounts = {{it->second.data_dir.string(), it->second.config.working_dir, false}};
    max_running_execs = std::max(max_running_execs, ++running_execs);
  }
  req.command = command;
  req.cwd = workdir;
  req.timeout = timeout + 2'000'000;
  SandboxResult res = PlainSandbox().Run(req);
  {
    std::lock_guard<std::mutex> lck(mtx);
    running_execs--;
  }
  return {res.exit_code, res.out + res.err, false};
}

void FakeRuntime::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lck(mtx);
  if (containers.erase(id)) removed++;
}
