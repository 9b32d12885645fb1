#include <sandcell/workspace.h>

#include "utils.h"

const char kSandboxWorkspace[] = "/workspace";

fs::path EnsureWorkspace(const SessionKey& key) {
  fs::path path = SessionWorkspacePath(key);
  std::error_code ec;
  if (fs::is_directory(path, ec)) return path;
  // the sandbox uid differs from ours
  if (!CreateDirs(path, fs::perms::all)) {
    throw WorkspaceError("Failed creating workspace " + path.string());
  }
  return path;
}

fs::path SandboxToHostPath(const SessionKey& key, const std::string& sandbox_path) {
  fs::path path = fs::path(sandbox_path).lexically_normal();
  fs::path rel = path.lexically_relative(kSandboxWorkspace);
  if (!path.is_absolute() || rel.empty() || *rel.begin() == "..") {
    throw WorkspaceError("Path must be inside " + std::string(kSandboxWorkspace) + ": " + sandbox_path);
  }
  fs::path root = SessionWorkspacePath(key);
  if (rel == ".") return root;
  return root / rel;
}

std::string HostToSandboxPath(const SessionKey& key, const fs::path& host_path) {
  fs::path root = SessionWorkspacePath(key);
  fs::path rel = host_path.lexically_normal().lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..") {
    throw WorkspaceError("Path is not inside the workspace of " + key.ToString() + ": " + host_path.string());
  }
  if (rel == ".") return kSandboxWorkspace;
  return (fs::path(kSandboxWorkspace) / rel).string();
}
