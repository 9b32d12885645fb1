#ifndef INCLUDE_SANDCELL_SESSION_H_
#define INCLUDE_SANDCELL_SESSION_H_

#include <string>
#include <optional>
#include <functional>

extern const char kDefaultUserId[];
extern const char kDefaultSessionId[];

struct SessionKey {
  std::string user_id;
  std::string session_id;

  bool operator==(const SessionKey& x) const {
    return user_id == x.user_id && session_id == x.session_id;
  }
  bool operator!=(const SessionKey& x) const { return !(*this == x); }
  // used as map key & for logging
  std::string ToString() const { return user_id + '/' + session_id; }
};

struct SessionKeyHash {
  size_t operator()(const SessionKey& key) const {
    return std::hash<std::string>()(key.ToString());
  }
};

// Throws std::invalid_argument if an identifier cannot be used as a path component
void ValidateSessionKey(const SessionKey&);

// The session of the calling thread; the default session if none is installed
SessionKey CurrentSession();

// Installs a session as current for the lifetime of the object
class ScopedSession {
  std::optional<SessionKey> prev_;
 public:
  explicit ScopedSession(const SessionKey& key);
  ~ScopedSession();
  ScopedSession(const ScopedSession&) = delete;
  ScopedSession& operator=(const ScopedSession&) = delete;
};

#endif  // INCLUDE_SANDCELL_SESSION_H_
