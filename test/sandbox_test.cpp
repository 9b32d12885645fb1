#include <unistd.h>
#include <chrono>
#include <fstream>
#include <sandcell/sandbox.h>

#include "utils.h"

namespace {

SandboxRequest Shell(const std::string& script, long timeout = 10'000'000) {
  SandboxRequest req;
  req.command = {"/bin/sh", "-c", script};
  req.timeout = timeout;
  req.env = {{"PATH", "/usr/bin:/bin"}};
  return req;
}

std::string ParamName(const ::testing::TestParamInfo<SandboxBackend>& info) {
  return SandboxBackendName(info.param);
}

} // namespace

class SandboxTest : public ScratchTest, public testing::WithParamInterface<SandboxBackend> {
 protected:
  std::unique_ptr<ProcessSandbox> sandbox;

  void SetUp() override {
    ScratchTest::SetUp();
    if (GetParam() == SandboxBackend::NAMESPACE && geteuid() != 0) {
      GTEST_SKIP() << "namespace sandbox requires root";
    }
    sandbox = MakeSandbox(GetParam());
    ASSERT_EQ(sandbox->Backend(), GetParam());
  }
};

TEST_P(SandboxTest, CapturesOutput) {
  auto res = sandbox->Run(Shell("echo hello; echo oops >&2"));
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.out, "hello\n");
  EXPECT_EQ(res.err, "oops\n");
}

TEST_P(SandboxTest, ExitCode) {
  auto res = sandbox->Run(Shell("exit 3"));
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_FALSE(res.timed_out);
}

TEST_P(SandboxTest, KilledBySignal) {
  if (GetParam() == SandboxBackend::NAMESPACE) {
    GTEST_SKIP() << "the shell may be the init of its PID namespace";
  }
  auto res = sandbox->Run(Shell("kill -9 $$"));
  EXPECT_EQ(res.exit_code, 128 + 9);
}

TEST_P(SandboxTest, Timeout) {
  auto start = std::chrono::steady_clock::now();
  auto res = sandbox->Run(Shell("sleep 30", 1'000'000));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.exit_code, -1);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_P(SandboxTest, TimeoutKillsChildren) {
  fs::path dir = root / "shared";
  fs::create_directories(dir);
  fs::permissions(dir, fs::perms::all);
  auto req = Shell("(sleep 2; touch leaked) & sleep 30", 500'000);
  req.bind_mounts = {{dir.string(), "/data", false}};
  req.cwd = "/data";
  auto res = sandbox->Run(req);
  EXPECT_TRUE(res.timed_out);
  sleep(3);
  EXPECT_FALSE(fs::exists(dir / "leaked"));
}

TEST_P(SandboxTest, BindMountAndWorkdir) {
  fs::path dir = root / "shared";
  fs::create_directories(dir);
  fs::permissions(dir, fs::perms::all);
  {
    std::ofstream fout(dir / "input.txt");
    fout << "42";
  }
  auto req = Shell("cat input.txt; echo done > output.txt");
  req.bind_mounts = {{dir.string(), "/data", false}};
  req.cwd = "/data";
  auto res = sandbox->Run(req);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.out, "42");
  std::ifstream fin(dir / "output.txt");
  std::string line;
  std::getline(fin, line);
  EXPECT_EQ(line, "done");
}

TEST_P(SandboxTest, Environment) {
  auto req = Shell("echo $GREETING");
  req.env["GREETING"] = "hi";
  auto res = sandbox->Run(req);
  EXPECT_EQ(res.out, "hi\n");
}

TEST_P(SandboxTest, EmptyCommandRejected) {
  SandboxRequest req;
  EXPECT_THROW(sandbox->Run(req), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(Backends, SandboxTest,
    testing::Values(SandboxBackend::NONE, SandboxBackend::NAMESPACE),
    ParamName);

class NamespaceSandboxTest : public ScratchTest {
 protected:
  NamespaceSandbox sandbox;
  void SetUp() override {
    ScratchTest::SetUp();
    if (geteuid() != 0) GTEST_SKIP() << "namespace sandbox requires root";
  }
};

TEST_F(NamespaceSandboxTest, HostFilesHidden) {
  fs::path secret = root / "secret.txt";
  {
    std::ofstream fout(secret);
    fout << "top secret";
  }
  auto res = sandbox.Run(Shell("cat " + secret.string()));
  EXPECT_NE(res.exit_code, 0);
  EXPECT_EQ(res.out.find("top secret"), std::string::npos);
}

TEST_F(NamespaceSandboxTest, ReadOnlyMount) {
  fs::path dir = root / "ro";
  fs::create_directories(dir);
  fs::permissions(dir, fs::perms::all);
  auto req = Shell("touch /ro/file");
  req.bind_mounts = {{dir.string(), "/ro", true}};
  auto res = sandbox.Run(req);
  EXPECT_NE(res.exit_code, 0);
  EXPECT_FALSE(fs::exists(dir / "file"));
}

TEST_F(NamespaceSandboxTest, NetworkIsolated) {
  auto req = Shell("cat /proc/net/dev | tail -n +3 | cut -d: -f1 | tr -d ' '");
  req.isolate_pid = false;
  req.isolate_network = true;
  auto res = sandbox.Run(req);
  EXPECT_EQ(res.exit_code, 0);
  // only the loopback device exists in a fresh network namespace
  EXPECT_EQ(res.out, "lo\n");
}

TEST_F(NamespaceSandboxTest, RunsAsSandboxUser) {
  auto res = sandbox.Run(Shell("id -u"));
  EXPECT_EQ(res.out, std::to_string(kSandboxUid) + "\n");
}

TEST_F(NamespaceSandboxTest, MissingMountSourceFails) {
  auto req = Shell("true");
  req.bind_mounts = {{(root / "nonexistent").string(), "/data", false}};
  EXPECT_THROW(sandbox.Run(req), SandboxError);
}

TEST_F(NamespaceSandboxTest, HostProcessTableOnlyWithoutPidIsolation) {
  auto req = Shell("test -d /proc/" + std::to_string(getpid()));
  req.isolate_pid = false;
  EXPECT_EQ(sandbox.Run(req).exit_code, 0);
  req.isolate_pid = true;
  EXPECT_NE(sandbox.Run(req).exit_code, 0);
}
