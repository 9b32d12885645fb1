#ifndef INCLUDE_SANDCELL_SENSITIVITY_H_
#define INCLUDE_SANDCELL_SENSITIVITY_H_

#include <string>
#include <vector>
#include <stdexcept>

#include "paths.h"
#include "session.h"

// ordered; comparisons between levels are meaningful
#define ENUM_SENSITIVITY_ \
  X(PUBLIC, "public") \
  X(INTERNAL, "internal") \
  X(CONFIDENTIAL, "confidential") \
  X(SECRET, "secret")
enum class Sensitivity {
#define X(name, str) name,
  ENUM_SENSITIVITY_
#undef X
};

// second column is the container runtime's name for it
#define ENUM_NETWORK_MODE_ \
  X(FULL, "bridge") \
  X(NONE, "none")
enum class NetworkMode {
#define X(name, str) name,
  ENUM_NETWORK_MODE_
#undef X
};

// Persisting an escalation failed; the escalation did not happen
class SensitivityError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SensitivityState {
  Sensitivity sensitivity;
  std::vector<std::string> datasets; // in registration order, no duplicates
};

class SensitivityTracker {
  KeyedMutex session_locks_;

  SensitivityState Load_(const SessionKey&);
  void Store_(const SessionKey&, const SensitivityState&);
 public:
  // Idempotent per name; sensitivity becomes max(current, level).
  // Persisted before returning; throws SensitivityError on failure.
  void AddDataset(const SessionKey&, const std::string& name, Sensitivity level);

  bool HasPrivateData(const SessionKey&);
  Sensitivity GetSensitivity(const SessionKey&);
  std::vector<std::string> Datasets(const SessionKey&);
  NetworkMode RequiredNetworkMode(const SessionKey&);
};

#endif  // INCLUDE_SANDCELL_SENSITIVITY_H_
