#include <sandcell/session.h>

#include <stdexcept>

#include "utils.h"

const char kDefaultUserId[] = "default_user";
const char kDefaultSessionId[] = "default_session";

namespace {

thread_local std::optional<SessionKey> current_session;

} // namespace

void ValidateSessionKey(const SessionKey& key) {
  if (!IsSafeName(key.user_id)) {
    throw std::invalid_argument("invalid user id: " + key.user_id);
  }
  if (!IsSafeName(key.session_id)) {
    throw std::invalid_argument("invalid session id: " + key.session_id);
  }
}

SessionKey CurrentSession() {
  if (current_session) return *current_session;
  return {kDefaultUserId, kDefaultSessionId};
}

ScopedSession::ScopedSession(const SessionKey& key) : prev_(current_session) {
  current_session = key;
}

ScopedSession::~ScopedSession() {
  current_session = prev_;
}
