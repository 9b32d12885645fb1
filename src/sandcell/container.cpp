#include <sandcell/container.h>

#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <sandcell/workspace.h>
#include "utils.h"

ContainerProfile kContainerProfile;
std::string kDockerSocket = "/var/run/docker.sock";
std::string kDockerApiVersion = "v1.43";

ContainerError::ContainerError(ContainerErrorKind kind, const std::string& msg) :
    std::runtime_error(std::string(ContainerErrorDesc(kind)) + ": " + msg), kind_(kind) {}

void SandboxSession::Touch() {
  last_active_at = NowMicros();
}

ContainerManager::ContainerManager(ContainerRuntime& runtime, SensitivityTracker& tracker,
                                   const ContainerProfile& profile) :
    runtime_(runtime), tracker_(tracker), profile_(profile) {}

ContainerManager::~ContainerManager() {
  try {
    CloseAll();
  } catch (const ContainerError& e) {
    spdlog::warn("Failed closing sessions on shutdown: {}", e.what());
  }
}

ContainerConfig ContainerManager::MakeConfig_(NetworkMode mode) const {
  ContainerConfig ret;
  ret.image = profile_.image;
  ret.cpu_limit = profile_.cpu_limit;
  ret.memory_limit = profile_.memory_limit;
  ret.working_dir = profile_.working_dir;
  ret.network_mode = mode;
  ret.read_only_mounts = profile_.read_only_mounts;
  ret.environment = profile_.environment;
  ret.user = profile_.user;
  return ret;
}

std::string ContainerManager::ContainerName_(const SessionKey& key, bool ephemeral) const {
  std::string ret = profile_.container_prefix + "-" + key.user_id + "-" + key.session_id;
  std::replace(ret.begin(), ret.end(), '@', '_');
  if (ephemeral) ret += "-" + RandomHex(8);
  return ret;
}

ExecResult ContainerManager::Exec_(const std::string& id, const std::string& command, long timeout) {
  using namespace std::chrono;
  long secs = std::max(1L, (timeout + 999'999) / 1'000'000);
  std::vector<std::string> cmd = {"timeout", "-k", "1", std::to_string(secs), "bash", "-c", command};
  auto start = steady_clock::now();
  ExecResult ret = runtime_.Exec(id, cmd, profile_.working_dir, timeout);
  long elapsed = duration_cast<microseconds>(steady_clock::now() - start).count();
  // 124: terminated by timeout; 137: killed after the grace period
  if ((ret.exit_code == 124 || ret.exit_code == 137) && elapsed >= timeout) ret.timed_out = true;
  if (ret.timed_out) {
    ret.output += fmt::format("\nCommand timed out after {} seconds", secs);
  }
  return ret;
}

SandboxSession& ContainerManager::EnsureSession_(const SessionKey& key) {
  NetworkMode required = tracker_.RequiredNetworkMode(key);
  std::unique_lock map_lck(sessions_mtx_);
  if (auto it = sessions_.find(key); it != sessions_.end()) {
    SandboxSession& session = it->second;
    map_lck.unlock();
    if (session.network_mode == required) return session;
    spdlog::info("Recreating container {} for {}: network {} -> {}", session.container_name,
                 key.ToString(), NetworkModeName(session.network_mode), NetworkModeName(required));
    ContainerConfig config = MakeConfig_(required);
    std::string id;
    try {
      runtime_.Remove(session.container_id);
      id = runtime_.Create(session.container_name, config, session.data_dir);
    } catch (const ContainerError&) {
      map_lck.lock();
      sessions_.erase(key);
      throw;
    }
    // GetSession reads under the map lock only
    map_lck.lock();
    session.config = std::move(config);
    session.container_id = std::move(id);
    session.network_mode = required;
    session.created_at = NowMicros();
    return session;
  }
  map_lck.unlock();

  SandboxSession session;
  session.key = key;
  session.container_name = ContainerName_(key, false);
  session.network_mode = required;
  session.config = MakeConfig_(required);
  session.data_dir = EnsureWorkspace(key);
  session.container_id = runtime_.Create(session.container_name, session.config, session.data_dir);
  session.created_at = session.last_active_at = NowMicros();
  map_lck.lock();
  return sessions_.insert_or_assign(key, std::move(session)).first->second;
}

ExecResult ContainerManager::ExecuteCommand(const SessionKey& key, const std::string& command,
                                            long timeout, bool persistent) {
  if (timeout <= 0) timeout = profile_.command_timeout;
  if (!persistent) {
    ContainerConfig config = MakeConfig_(tracker_.RequiredNetworkMode(key));
    std::string id = runtime_.Create(ContainerName_(key, true), config, EnsureWorkspace(key));
    ExecResult ret;
    try {
      ret = Exec_(id, command, timeout);
    } catch (const ContainerError&) {
      runtime_.Remove(id);
      throw;
    }
    runtime_.Remove(id);
    return ret;
  }

  // held across the posture check and the command, so a recreation never
  // overlaps another command of the same session
  KeyedMutex::Lock lck(session_locks_, key.ToString());
  std::string id;
  {
    SandboxSession& session = EnsureSession_(key);
    std::lock_guard map_lck(sessions_mtx_);
    session.Touch();
    id = session.container_id;
  }
  try {
    return Exec_(id, command, timeout);
  } catch (const ContainerError& e) {
    if (e.Kind() == ContainerErrorKind::CONTAINER_NOT_FOUND) {
      spdlog::warn("Container of {} vanished; it will be recreated on next use", key.ToString());
      std::lock_guard map_lck(sessions_mtx_);
      sessions_.erase(key);
    }
    throw;
  }
}

void ContainerManager::CloseSession(const SessionKey& key) {
  KeyedMutex::Lock lck(session_locks_, key.ToString());
  std::string id;
  {
    std::lock_guard map_lck(sessions_mtx_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) return;
    id = it->second.container_id;
    sessions_.erase(it);
  }
  runtime_.Remove(id);
  spdlog::info("Session closed: {}", key.ToString());
}

void ContainerManager::CloseAll() {
  std::vector<SessionKey> keys;
  {
    std::lock_guard map_lck(sessions_mtx_);
    for (auto& i : sessions_) keys.push_back(i.first);
  }
  for (auto& key : keys) CloseSession(key);
}

std::optional<SandboxSession> ContainerManager::GetSession(const SessionKey& key) {
  std::lock_guard map_lck(sessions_mtx_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}
