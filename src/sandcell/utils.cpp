#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cctype>
#include <atomic>
#include <chrono>
#include <random>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long run_id_seq = 0;

} // namespace

long GetUniqueRunId() {
  return ++run_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_PARSE_ARG1(cls, x, ...) if (str == #x) return cls::x;
#define X_PARSE_ARG2(cls, x, y, ...) if (str == y) return cls::x;

#define X(...) X_RETURN_ARG2(Sensitivity, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SensitivityName, Sensitivity, ENUM_SENSITIVITY_)
#undef X

std::optional<Sensitivity> GetSensitivity(const std::string& str) {
#define X(...) X_PARSE_ARG2(Sensitivity, __VA_ARGS__)
  ENUM_SENSITIVITY_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(NetworkMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* NetworkModeName, NetworkMode, ENUM_NETWORK_MODE_)
#undef X

#define X(...) X_RETURN_ARG2(SandboxBackend, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxBackendName, SandboxBackend, ENUM_SANDBOX_BACKEND_)
#undef X

std::optional<SandboxBackend> GetSandboxBackend(const std::string& str) {
#define X(...) X_PARSE_ARG2(SandboxBackend, __VA_ARGS__)
  ENUM_SANDBOX_BACKEND_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(SnapshotPolicy, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SnapshotPolicyName, SnapshotPolicy, ENUM_SNAPSHOT_POLICY_)
#undef X

std::optional<SnapshotPolicy> GetSnapshotPolicy(const std::string& str) {
#define X(...) X_PARSE_ARG2(SnapshotPolicy, __VA_ARGS__)
  ENUM_SNAPSHOT_POLICY_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG1(CellState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CellStateName, CellState, ENUM_CELL_STATE_)
#undef X

std::optional<CellState> GetCellState(const std::string& str) {
#define X(...) X_PARSE_ARG1(CellState, __VA_ARGS__)
  ENUM_CELL_STATE_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG1(OutputType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutputTypeName, OutputType, ENUM_OUTPUT_TYPE_)
#undef X

std::optional<OutputType> GetOutputType(const std::string& str) {
#define X(...) X_PARSE_ARG1(OutputType, __VA_ARGS__)
  ENUM_OUTPUT_TYPE_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(ToolPermission, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ToolPermissionName, ToolPermission, ENUM_TOOL_PERMISSION_)
#undef X

#define X(...) X_RETURN_ARG2(ContainerErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ContainerErrorDesc, ContainerErrorKind, ENUM_CONTAINER_ERROR_)
#undef X

#define X(...) X_RETURN_ARG1(NotebookErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* NotebookErrorName, NotebookErrorKind, ENUM_NOTEBOOK_ERROR_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_PARSE_ARG1
#undef X_PARSE_ARG2

int64_t NowMicros() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string RandomHex(size_t len) {
  static const char kHex[] = "0123456789abcdef";
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 15);
  std::string ret(len, '0');
  for (auto& i : ret) i = kHex[dist(gen)];
  return ret;
}

bool IsSafeName(const std::string& str) {
  if (str.empty() || str.size() > 128 || str == "." || str == "..") return false;
  for (char c : str) {
    if (!isalnum((unsigned char)c) && c != '-' && c != '_' && c != '.' && c != '@') return false;
  }
  return true;
}

long ParseMemoryLimit(const std::string& str) {
  size_t pos = 0;
  long val;
  try {
    val = std::stol(str, &pos);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("invalid memory limit: " + str);
  }
  if (val < 0) throw std::invalid_argument("invalid memory limit: " + str);
  std::string suffix = str.substr(pos);
  if (suffix.empty() || suffix == "b") return val;
  switch (tolower(suffix[0])) {
    case 'k': return val << 10;
    case 'm': return val << 20;
    case 'g': return val << 30;
  }
  throw std::invalid_argument("invalid memory limit: " + str);
}

std::vector<std::pair<std::string, std::string>> ParsePairs(const std::string& str) {
  std::vector<std::pair<std::string, std::string>> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    if (item.empty()) continue;
    size_t pos = item.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == item.size()) {
      throw std::invalid_argument("expected host:target, got " + item);
    }
    ret.emplace_back(item.substr(0, pos), item.substr(pos + 1));
  }
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool Move(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Move file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    if (ec.value() != EXDEV) goto err;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) goto err;
    fs::remove(from, ec);
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed moving {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::stringstream ss;
  ss << fin.rdbuf();
  if (fin.bad()) {
    spdlog::warn("Failed reading {}", path.c_str());
    return std::nullopt;
  }
  return ss.str();
}

bool WriteFileAtomic(const fs::path& path, const std::string& content) {
  fs::path tmp = path;
  tmp += ".tmp" + RandomHex(6);
  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) goto err;
  for (size_t done = 0; done < content.size();) {
    ssize_t ret = write(fd, content.data() + done, content.size() - done);
    if (ret < 0) {
      if (errno == EINTR) continue;
      goto err_fd;
    }
    done += ret;
  }
  if (fsync(fd) < 0) goto err_fd;
  if (close(fd) < 0) goto err_tmp;
  if (rename(tmp.c_str(), path.c_str()) < 0) goto err_tmp;
  return true;
err_fd:
  close(fd);
err_tmp:
  unlink(tmp.c_str());
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}
