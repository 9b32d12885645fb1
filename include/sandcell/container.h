#ifndef INCLUDE_SANDCELL_CONTAINER_H_
#define INCLUDE_SANDCELL_CONTAINER_H_

#include <map>
#include <cstdint>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include "paths.h"
#include "session.h"
#include "sensitivity.h"

#define ENUM_CONTAINER_ERROR_ \
  X(DAEMON_UNAVAILABLE, "container runtime unavailable") \
  X(IMAGE_NOT_FOUND, "image not found") \
  X(CONTAINER_NOT_FOUND, "container not found") \
  X(RUNTIME, "container runtime error")
enum class ContainerErrorKind {
#define X(name, desc) name,
  ENUM_CONTAINER_ERROR_
#undef X
};

// Infrastructure failure; distinct from a nonzero exit code of the command
class ContainerError : public std::runtime_error {
  ContainerErrorKind kind_;
 public:
  ContainerError(ContainerErrorKind kind, const std::string& msg);
  ContainerErrorKind Kind() const { return kind_; }
};

struct ContainerConfig {
  std::string image;
  double cpu_limit; // cores
  std::string memory_limit; // e.g. "512m"
  std::string working_dir;
  NetworkMode network_mode;
  std::map<std::string, std::string> read_only_mounts; // host -> sandbox
  std::map<std::string, std::string> environment;
  std::string user;
};

struct ContainerProfile {
  std::string image = "python:3.12-slim";
  double cpu_limit = 1.0;
  std::string memory_limit = "512m";
  std::string working_dir = "/workspace";
  std::string user = "nobody";
  std::string container_prefix = "sandcell";
  long command_timeout = 30'000'000; // us
  std::map<std::string, std::string> read_only_mounts;
  std::map<std::string, std::string> environment;
};
extern ContainerProfile kContainerProfile;
extern std::string kDockerSocket;
extern std::string kDockerApiVersion;

struct ExecResult {
  int exit_code;
  std::string output; // stdout followed by stderr
  bool timed_out;
};

class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;
  // Create and start; data_dir is bind-mounted read-write at config.working_dir.
  // Returns the container id.
  virtual std::string Create(const std::string& name, const ContainerConfig& config,
                             const fs::path& data_dir) = 0;
  virtual ExecResult Exec(const std::string& id, const std::vector<std::string>& command,
                          const std::string& workdir, long timeout) = 0;
  // Removing a container that does not exist is not an error
  virtual void Remove(const std::string& id) = 0;
};

// Docker Engine API over a unix socket
std::unique_ptr<ContainerRuntime> MakeDockerRuntime(
    const std::string& socket_path = kDockerSocket,
    const std::string& api_version = kDockerApiVersion);

class SandboxSession {
 public:
  SessionKey key;
  std::string container_id;
  std::string container_name;
  NetworkMode network_mode;
  ContainerConfig config;
  fs::path data_dir;
  int64_t created_at; // UNIX timestamp, microseconds
  int64_t last_active_at;

  void Touch();
};

class ContainerManager {
  ContainerRuntime& runtime_;
  SensitivityTracker& tracker_;
  ContainerProfile profile_;

  std::mutex sessions_mtx_;
  std::unordered_map<SessionKey, SandboxSession, SessionKeyHash> sessions_;
  KeyedMutex session_locks_;

  ContainerConfig MakeConfig_(NetworkMode) const;
  std::string ContainerName_(const SessionKey&, bool ephemeral) const;
  SandboxSession& EnsureSession_(const SessionKey&);
  ExecResult Exec_(const std::string& id, const std::string& command, long timeout);
 public:
  ContainerManager(ContainerRuntime& runtime, SensitivityTracker& tracker,
                   const ContainerProfile& profile = kContainerProfile);
  ~ContainerManager();

  // timeout in us; 0 uses the profile's command timeout
  ExecResult ExecuteCommand(const SessionKey&, const std::string& command,
                            long timeout = 0, bool persistent = false);
  void CloseSession(const SessionKey&);
  void CloseAll();
  std::optional<SandboxSession> GetSession(const SessionKey&);
};

#endif  // INCLUDE_SANDCELL_CONTAINER_H_
