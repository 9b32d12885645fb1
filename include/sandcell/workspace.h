#ifndef INCLUDE_SANDCELL_WORKSPACE_H_
#define INCLUDE_SANDCELL_WORKSPACE_H_

#include <string>
#include <stdexcept>

#include "paths.h"
#include "session.h"

// the workspace as seen from inside a sandbox
extern const char kSandboxWorkspace[];

class WorkspaceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Creates the session workspace if needed; writable by the sandbox uid
fs::path EnsureWorkspace(const SessionKey&);

// "/workspace/a/b" -> <workspace_root>/<user>/<session>/a/b; throws WorkspaceError
// if the path is outside /workspace or escapes it
fs::path SandboxToHostPath(const SessionKey&, const std::string& sandbox_path);
std::string HostToSandboxPath(const SessionKey&, const fs::path& host_path);

#endif  // INCLUDE_SANDCELL_WORKSPACE_H_
