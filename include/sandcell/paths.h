#ifndef INCLUDE_SANDCELL_PATHS_H_
#define INCLUDE_SANDCELL_PATHS_H_

#include <mutex>
#include <string>
#include <filesystem>
#include <unordered_map>

#include "session.h"

namespace fs = std::filesystem;

extern fs::path kBoxRoot;
extern fs::path kWorkspaceRoot;
// must not be reachable from any sandbox
extern fs::path kPrivateDataRoot;
extern fs::path kNotebookRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// One mutex per key; an entry exists only while some thread holds or waits
// for it, so the map stays as small as the set of busy keys.
class KeyedMutex {
  struct Entry {
    std::mutex mtx;
    int users = 0;
  };
  std::mutex global_lock_;
  std::unordered_map<std::string, Entry> mutex_map_;
 public:
  class Lock {
    KeyedMutex& owner_;
    std::string key_;
    Entry* entry_;
   public:
    Lock(KeyedMutex& owner, const std::string& key);
    ~Lock();
    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;
  };

  size_t Size();
};

// per-session host directories; all of these validate the key
fs::path SessionWorkspacePath(const SessionKey&);
fs::path PrivateDataPath(const SessionKey&);
fs::path PrivateDataFile(const SessionKey&);
fs::path NotebookPath(const SessionKey&);
fs::path NotebookFile(const SessionKey&);
fs::path NotebookSnapshotFile(const SessionKey&);

// for sandbox runs
fs::path SandboxRunPath(long id);
fs::path SandboxBoxPath(long id);
fs::path SandboxStdoutFile(long id);
fs::path SandboxStderrFile(long id);

fs::path SandboxExecProgram();
fs::path NotebookExecProgram();

#endif  // INCLUDE_SANDCELL_PATHS_H_
