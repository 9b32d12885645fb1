#ifndef INCLUDE_SANDCELL_SANDBOX_H_
#define INCLUDE_SANDCELL_SANDBOX_H_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

// KiB
extern long kMaxRSS;
extern long kMaxOutput;
extern int kMaxProcs;
extern int kSandboxUid;

#define ENUM_SANDBOX_BACKEND_ \
  X(NAMESPACE, "namespace") \
  X(NONE, "none")
enum class SandboxBackend {
#define X(name, str) name,
  ENUM_SANDBOX_BACKEND_
#undef X
};

struct BindMount {
  std::string source; // host path
  std::string target; // path inside sandbox
  bool readonly;
};

class SandboxRequest {
 public:
  std::vector<std::string> command;
  std::vector<BindMount> bind_mounts;
  long timeout; // us; 0 for unlimited
  bool isolate_network;
  bool isolate_pid;
  std::string cwd; // inside sandbox
  std::map<std::string, std::string> env;

  SandboxRequest() :
      timeout(0),
      isolate_network(true),
      isolate_pid(true),
      cwd("/") {}
};

struct SandboxResult {
  int exit_code; // -1 if timed out; 128+signal if killed
  std::string out, err;
  bool timed_out;
};

// The isolation machinery itself failed; never raised for timeouts or
// nonzero exit codes of the command
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ProcessSandbox {
 public:
  virtual ~ProcessSandbox() = default;
  virtual SandboxResult Run(const SandboxRequest&) = 0;
  virtual SandboxBackend Backend() const = 0;
};

// Mount/PID (and optionally network) namespaces via cjail; requires root.
// cjail always starts the command in a new PID namespace, so isolate_pid only
// controls whether the host's /proc (and with it the host process table) is
// visible inside the box. The process itself cannot signal host processes
// either way.
class NamespaceSandbox : public ProcessSandbox {
 public:
  SandboxResult Run(const SandboxRequest&) override;
  SandboxBackend Backend() const override { return SandboxBackend::NAMESPACE; }
};

// Plain subprocess; only for development on hosts without namespaces.
// Bind mount targets in cwd and command arguments are rewritten to their
// host sources.
class PlainSandbox : public ProcessSandbox {
 public:
  SandboxResult Run(const SandboxRequest&) override;
  SandboxBackend Backend() const override { return SandboxBackend::NONE; }
};

std::unique_ptr<ProcessSandbox> MakeSandbox(SandboxBackend);

#endif  // INCLUDE_SANDCELL_SANDBOX_H_
