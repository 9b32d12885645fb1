#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <string>

#include <gtest/gtest.h>
#include <sandcell/utils.h>
#include <sandcell/paths.h>

fs::path TestRoot();

// Points all storage roots to a fresh directory, removed afterwards
class ScratchTest : public testing::Test {
 protected:
  fs::path root;
  void SetUp() override;
  void TearDown() override;
};

// Runs container commands with PlainSandbox on the host; the data dir is
// mapped to the container's working directory
class FakeRuntime : public ContainerRuntime {
 public:
  struct Container {
    std::string name;
    ContainerConfig config;
    fs::path data_dir;
  };

  std::mutex mtx;
  std::map<std::string, Container> containers;
  std::vector<ContainerConfig> history; // every Create
  int created = 0, removed = 0;
  int running_execs = 0, max_running_execs = 0;
  bool fail_create = false;
  // removed behind the manager's back on the next Exec
  bool vanish = false;

  std::string Create(const std::string& name, const ContainerConfig& config,
                     const fs::path& data_dir) override;
  ExecResult Exec(const std::string& id, const std::vector<std::string>& command,
                  const std::string& workdir, long timeout) override;
  void Remove(const std::string& id) override;
};

#endif // TEST_UTILS_H_
