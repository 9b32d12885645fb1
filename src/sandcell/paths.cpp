#include <sandcell/paths.h>

#include <unistd.h>

fs::path kBoxRoot = "/tmp/sandcell_box";
fs::path kWorkspaceRoot = "/var/lib/sandcell/workspaces";
fs::path kPrivateDataRoot = "/var/lib/sandcell/private_data";
fs::path kNotebookRoot = "/var/lib/sandcell/notebooks";

namespace internal {
fs::path kDataDir = fs::path(SANDCELL_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path SessionPath(const fs::path& root, const SessionKey& key) {
  ValidateSessionKey(key);
  return root / key.user_id / key.session_id;
}

} // namespace

KeyedMutex::Lock::Lock(KeyedMutex& owner, const std::string& key) : owner_(owner), key_(key) {
  {
    std::lock_guard lck(owner_.global_lock_);
    entry_ = &owner_.mutex_map_[key_];
    entry_->users++;
  }
  entry_->mtx.lock();
}

KeyedMutex::Lock::~Lock() {
  entry_->mtx.unlock();
  std::lock_guard lck(owner_.global_lock_);
  if (--entry_->users == 0) owner_.mutex_map_.erase(key_);
}

size_t KeyedMutex::Size() {
  std::lock_guard lck(global_lock_);
  return mutex_map_.size();
}

fs::path SessionWorkspacePath(const SessionKey& key) {
  return SessionPath(kWorkspaceRoot, key);
}

fs::path PrivateDataPath(const SessionKey& key) {
  return SessionPath(kPrivateDataRoot, key);
}
fs::path PrivateDataFile(const SessionKey& key) {
  return PrivateDataPath(key) / ".private_data";
}

fs::path NotebookPath(const SessionKey& key) {
  return SessionPath(kNotebookRoot, key);
}
fs::path NotebookFile(const SessionKey& key) {
  return NotebookPath(key) / "cells.json";
}
fs::path NotebookSnapshotFile(const SessionKey& key) {
  return NotebookPath(key) / "namespace.bin";
}

fs::path SandboxRunPath(long id) {
  return kBoxRoot / (PadInt(getpid(), 7) + "_" + PadInt(id, 6));
}
fs::path SandboxBoxPath(long id) {
  return SandboxRunPath(id) / "box";
}
fs::path SandboxStdoutFile(long id) {
  return SandboxRunPath(id) / "stdout";
}
fs::path SandboxStderrFile(long id) {
  return SandboxRunPath(id) / "stderr";
}

fs::path SandboxExecProgram() {
  return internal::kDataDir / "sandcell-sandbox-exec";
}
fs::path NotebookExecProgram() {
  return internal::kDataDir / "sandcell-notebook-exec";
}
