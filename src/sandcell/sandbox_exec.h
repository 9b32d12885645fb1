#ifndef SANDCELL_SANDBOX_EXEC_H_
#define SANDCELL_SANDBOX_EXEC_H_

#include "sandbox_options.h"

// Runs opt in a freshly forked sandcell-sandbox-exec helper.
// On failure of the helper itself, timekill is -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions& opt);

#endif  // SANDCELL_SANDBOX_EXEC_H_
