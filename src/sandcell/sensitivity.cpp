#include <sandcell/sensitivity.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace {

// fail closed: a session whose state cannot be read is treated as holding secrets
SensitivityState Unreadable(const SessionKey& key, const std::string& reason) {
  spdlog::error("Sensitivity state of {} unreadable ({}); assuming {}",
                key.ToString(), reason, SensitivityName(Sensitivity::SECRET));
  return {Sensitivity::SECRET, {}};
}

} // namespace

SensitivityState SensitivityTracker::Load_(const SessionKey& key) {
  fs::path file = PrivateDataFile(key);
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    if (ec) return Unreadable(key, ec.message());
    return {Sensitivity::PUBLIC, {}};
  }
  auto content = ReadFile(file);
  if (!content) return Unreadable(key, "read error");
  try {
    auto json = nlohmann::json::parse(*content);
    auto level = ::GetSensitivity(json.at("sensitivity").get<std::string>());
    if (!level) return Unreadable(key, "unknown level");
    SensitivityState ret{*level, json.at("private_datasets").get<std::vector<std::string>>()};
    // a file claiming private data never reads as public
    if (json.value("has_private_data", false) && ret.sensitivity == Sensitivity::PUBLIC) {
      return Unreadable(key, "inconsistent state");
    }
    return ret;
  } catch (const nlohmann::json::exception& e) {
    return Unreadable(key, e.what());
  }
}

void SensitivityTracker::Store_(const SessionKey& key, const SensitivityState& state) {
  fs::path dir = PrivateDataPath(key);
  nlohmann::json json = {
    {"has_private_data", state.sensitivity > Sensitivity::PUBLIC},
    {"private_datasets", state.datasets},
    {"sensitivity", SensitivityName(state.sensitivity)},
  };
  if (!CreateDirs(dir, fs::perms::owner_all) || !WriteFileAtomic(PrivateDataFile(key), json.dump(2))) {
    throw SensitivityError("Failed persisting sensitivity state of " + key.ToString());
  }
}

void SensitivityTracker::AddDataset(const SessionKey& key, const std::string& name, Sensitivity level) {
  KeyedMutex::Lock lck(session_locks_, key.ToString());
  SensitivityState state = Load_(key);
  if (std::find(state.datasets.begin(), state.datasets.end(), name) == state.datasets.end()) {
    state.datasets.push_back(name);
  }
  Sensitivity prev = state.sensitivity;
  state.sensitivity = std::max(state.sensitivity, level);
  Store_(key, state);
  if (state.sensitivity != prev) {
    spdlog::info("Session {} sensitivity {} -> {} (dataset {})", key.ToString(),
                 SensitivityName(prev), SensitivityName(state.sensitivity), name);
  }
}

bool SensitivityTracker::HasPrivateData(const SessionKey& key) {
  return GetSensitivity(key) > Sensitivity::PUBLIC;
}

Sensitivity SensitivityTracker::GetSensitivity(const SessionKey& key) {
  KeyedMutex::Lock lck(session_locks_, key.ToString());
  return Load_(key).sensitivity;
}

std::vector<std::string> SensitivityTracker::Datasets(const SessionKey& key) {
  KeyedMutex::Lock lck(session_locks_, key.ToString());
  return Load_(key).datasets;
}

NetworkMode SensitivityTracker::RequiredNetworkMode(const SessionKey& key) {
  return GetSensitivity(key) > Sensitivity::PUBLIC ? NetworkMode::NONE : NetworkMode::FULL;
}
