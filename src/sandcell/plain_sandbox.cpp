#include <sandcell/sandbox.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <thread>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace {

// the longest matching bind mount target wins
std::string ToHostPath(const std::vector<BindMount>& mounts, const std::string& path) {
  const BindMount* best = nullptr;
  for (auto& i : mounts) {
    const std::string& target = i.target;
    if (path.compare(0, target.size(), target) != 0) continue;
    if (path.size() != target.size() && path[target.size()] != '/') continue;
    if (!best || target.size() > best->target.size()) best = &i;
  }
  if (!best) return path;
  return best->source + path.substr(best->target.size());
}

void AppendLimited(std::string& buf, const char* data, size_t len) {
  size_t limit = (size_t)kMaxOutput * 1024;
  if (buf.size() >= limit) return;
  buf.append(data, std::min(len, limit - buf.size()));
}

} // namespace

SandboxResult PlainSandbox::Run(const SandboxRequest& req) {
  using namespace std::chrono;
  if (req.command.empty()) throw std::invalid_argument("empty sandbox command");
  std::vector<std::string> args, envs;
  for (auto& i : req.command) args.push_back(ToHostPath(req.bind_mounts, i));
  for (auto& [key, val] : req.env) envs.push_back(key + '=' + ToHostPath(req.bind_mounts, val));
  std::string cwd = ToHostPath(req.bind_mounts, req.cwd);
  std::vector<char*> argv, envp;
  for (auto& i : args) argv.push_back(i.data());
  argv.push_back(nullptr);
  for (auto& i : envs) envp.push_back(i.data());
  envp.push_back(nullptr);
  char** child_env = req.env.empty() ? environ : envp.data();

  int outpipe[2], errpipe[2];
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    throw SandboxError(std::string("pipe: ") + strerror(errno));
  }
  if (pipe2(errpipe, O_CLOEXEC) < 0) {
    int saved_errno = errno;
    close(outpipe[0]);
    close(outpipe[1]);
    throw SandboxError(std::string("pipe: ") + strerror(saved_errno));
  }
  spdlog::debug("Plain sandbox command={} cwd={}", fmt::format("{}", args), cwd);
  auto start = steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    int saved_errno = errno;
    for (int fd : {outpipe[0], outpipe[1], errpipe[0], errpipe[1]}) close(fd);
    throw SandboxError(std::string("fork: ") + strerror(saved_errno));
  }
  if (pid == 0) {
    setpgid(0, 0);
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) dup2(null_fd, 0);
    dup2(outpipe[1], 1);
    dup2(errpipe[1], 2);
    if (chdir(cwd.c_str()) < 0) {
      dprintf(2, "chdir %s: %s\n", cwd.c_str(), strerror(errno));
      _exit(127);
    }
    execvpe(argv[0], argv.data(), child_env);
    dprintf(2, "exec %s: %s\n", argv[0], strerror(errno));
    _exit(127);
  }
  setpgid(pid, pid);
  close(outpipe[1]);
  close(errpipe[1]);

  SandboxResult ret{};
  struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
  std::string* bufs[2] = {&ret.out, &ret.err};
  auto deadline = start + microseconds(req.timeout);
  int status = 0;
  bool exited = false;
  char buf[65536];
  while (true) {
    long remaining_ms = -1;
    if (req.timeout > 0) {
      auto remaining = deadline - steady_clock::now();
      if (remaining <= nanoseconds(0)) {
        ret.timed_out = true;
        break;
      }
      remaining_ms = duration_cast<milliseconds>(remaining).count() + 1;
    }
    if (fds[0].fd < 0 && fds[1].fd < 0) {
      // both streams closed; the process may still be running
      pid_t res = waitpid(pid, &status, WNOHANG);
      if (res == pid) {
        exited = true;
        break;
      }
      if (res < 0 && errno != EINTR) break;
      std::this_thread::sleep_for(milliseconds(
          remaining_ms < 0 ? 10 : std::min(10L, remaining_ms)));
      continue;
    }
    int nready = poll(fds, 2, remaining_ms < 0 ? -1 : (int)std::min(remaining_ms, 1000L));
    if (nready < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      ret.timed_out = req.timeout > 0;
      break;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len < 0 && errno == EINTR) continue;
      if (len <= 0) {
        close(fds[i].fd);
        fds[i].fd = -1;
        continue;
      }
      AppendLimited(*bufs[i], buf, len);
    }
  }
  // kills the whole process group, including background children
  kill(-pid, SIGKILL);
  if (!exited) waitpid(pid, &status, 0);
  for (auto& i : fds) {
    if (i.fd >= 0) close(i.fd);
  }
  if (ret.timed_out) {
    ret.exit_code = -1;
  } else if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.exit_code = 128 + WTERMSIG(status);
  } else {
    ret.exit_code = -1;
  }
  spdlog::info("Plain sandbox finished: pid={} exit_code={} timed_out={}", pid, ret.exit_code, ret.timed_out);
  return ret;
}
