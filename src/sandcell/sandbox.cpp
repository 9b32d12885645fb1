#include <sandcell/sandbox.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>
#include <sandcell/paths.h>
#include "utils.h"
#include "sandbox_exec.h"

long kMaxRSS = 1 * 1024 * 1024; // 1G
long kMaxOutput = 256 * 1024; // 256M
int kMaxProcs = 64;
int kSandboxUid = 65534;

namespace {

const char* const kSystemDirs[] = {"/usr", "/lib", "/lib64", "/bin", "/sbin", "/etc/alternatives"};
// only visible when the network is shared
const char* const kNetworkFiles[] = {"/etc/resolv.conf", "/etc/hosts", "/etc/ssl"};

class RunPathGuard {
  fs::path path_;
 public:
  explicit RunPathGuard(fs::path path) : path_(std::move(path)) {}
  ~RunPathGuard() { RemoveAll(path_); }
};

class FdGuard {
  std::vector<int> fds_;
 public:
  int Add(int fd) {
    if (fd >= 0) fds_.push_back(fd);
    return fd;
  }
  ~FdGuard() {
    for (int fd : fds_) close(fd);
  }
};

inline int ExitCode(const struct cjail_result& res) {
  if (res.info.si_code == CLD_EXITED) return res.info.si_status;
  return 128 + res.info.si_status;
}

} // namespace

std::unique_ptr<ProcessSandbox> MakeSandbox(SandboxBackend backend) {
  switch (backend) {
    case SandboxBackend::NAMESPACE: return std::make_unique<NamespaceSandbox>();
    case SandboxBackend::NONE: return std::make_unique<PlainSandbox>();
  }
  __builtin_unreachable();
}

SandboxResult NamespaceSandbox::Run(const SandboxRequest& req) {
  if (req.command.empty()) throw std::invalid_argument("empty sandbox command");
  long id = GetUniqueRunId();
  fs::path box = SandboxBoxPath(id);
  if (!CreateDirs(box, kPerm755)) {
    throw SandboxError("Failed creating sandbox directory " + box.string());
  }
  RunPathGuard run_path_guard(SandboxRunPath(id));

  SandboxOptions opt;
  opt.boxdir = box;
  opt.command = req.command;
  for (auto& [key, val] : req.env) opt.envs.push_back(key + '=' + val);
  opt.workdir = req.cwd;
  opt.uid = opt.gid = kSandboxUid;
  opt.wall_time = req.timeout;
  opt.rss = kMaxRSS;
  opt.fsize = kMaxOutput;
  opt.proc_num = kMaxProcs;
  opt.share_net = !req.isolate_network;

  // mount points are created inside the box; missing sources are skipped
  auto AddMount = [&](const std::string& source, const std::string& target, bool readonly) {
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) return false;
    fs::path point = box / fs::path(target).relative_path();
    if (fs::is_directory(status)) {
      if (!CreateDirs(point)) return false;
    } else {
      if (!CreateDirs(point.parent_path())) return false;
      std::ofstream touch(point);
      if (!touch) return false;
    }
    opt.mounts.push_back({source, target, readonly});
    return true;
  };
  for (const char* dir : kSystemDirs) AddMount(dir, dir, true);
  if (!req.isolate_network) {
    for (const char* file : kNetworkFiles) AddMount(file, file, true);
  }
  // cjail always creates a new PID namespace; without isolation the host
  // process table is exposed through the host's /proc
  if (!req.isolate_pid) AddMount("/proc", "/proc", true);
  for (auto& i : req.bind_mounts) {
    if (!AddMount(i.source, i.target, i.readonly)) {
      throw SandboxError("Failed binding " + i.source + " to " + i.target);
    }
  }
  if (!CreateDirs(box / fs::path(req.cwd).relative_path())) {
    throw SandboxError("Failed creating working directory " + req.cwd);
  }

  FdGuard fd_guard;
  opt.fd_input = fd_guard.Add(open("/dev/null", O_RDONLY));
  opt.fd_output = fd_guard.Add(open(SandboxStdoutFile(id).c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
  opt.fd_error = fd_guard.Add(open(SandboxStderrFile(id).c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
  if (opt.fd_input < 0 || opt.fd_output < 0 || opt.fd_error < 0) {
    throw SandboxError(std::string("Failed opening sandbox streams: ") + strerror(errno));
  }

  struct cjail_result res = SandboxExec(opt);
  if (res.timekill == -1) {
    throw SandboxError(std::string("Sandbox execution failed: ") + strerror(res.oomkill));
  }
  SandboxResult ret;
  ret.timed_out = res.timekill != 0;
  ret.exit_code = ret.timed_out ? -1 : ExitCode(res);
  if (res.oomkill > 0) spdlog::info("Sandbox run {} hit the memory limit", id);
  ret.out = ReadFile(SandboxStdoutFile(id)).value_or("");
  ret.err = ReadFile(SandboxStderrFile(id)).value_or("");
  spdlog::info("Sandbox run finished: id={} exit_code={} timed_out={}", id, ret.exit_code, ret.timed_out);
  return ret;
}
