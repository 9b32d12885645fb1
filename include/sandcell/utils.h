#ifndef INCLUDE_SANDCELL_UTILS_H_
#define INCLUDE_SANDCELL_UTILS_H_

#include <string>
#include <optional>

#include "tools.h"
#include "sandbox.h"
#include "notebook.h"
#include "container.h"
#include "sensitivity.h"

long GetUniqueRunId();

const char* SensitivityName(Sensitivity);
std::optional<Sensitivity> GetSensitivity(const std::string&);

const char* NetworkModeName(NetworkMode);

const char* SandboxBackendName(SandboxBackend);
std::optional<SandboxBackend> GetSandboxBackend(const std::string&);

const char* SnapshotPolicyName(SnapshotPolicy);
std::optional<SnapshotPolicy> GetSnapshotPolicy(const std::string&);

const char* CellStateName(CellState);
std::optional<CellState> GetCellState(const std::string&);
const char* OutputTypeName(OutputType);
std::optional<OutputType> GetOutputType(const std::string&);

const char* ToolPermissionName(ToolPermission);

// logging
const char* ContainerErrorDesc(ContainerErrorKind);
const char* NotebookErrorName(NotebookErrorKind);

#endif  // INCLUDE_SANDCELL_UTILS_H_
