#ifndef SANDCELL_UTILS_H_
#define SANDCELL_UTILS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <sandcell/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

int64_t NowMicros();
// random lowercase hex string of the given length
std::string RandomHex(size_t len);

bool IsSafeName(const std::string&);
// "512m" -> bytes; std::invalid_argument if malformed
long ParseMemoryLimit(const std::string&);
// "a:b,c:d" -> {a: b, c: d}
std::vector<std::pair<std::string, std::string>> ParsePairs(const std::string&);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// These functions resolve symlinks; Move allows cross-device move
bool Move(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);

std::optional<std::string> ReadFile(const fs::path&);
// write to a temporary sibling, fsync and rename over the target
bool WriteFileAtomic(const fs::path&, const std::string& content);

#endif  // SANDCELL_UTILS_H_
