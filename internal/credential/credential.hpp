#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace swarm::credential {

/*
  Process-wide shared credential.

  `epoch` increases by one with every successful refresh, so a holder can
  tell whether the credential it used is still the current one.
*/
struct Credential {
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;

  util::TimePoint expires_at = util::TimePoint::max();
  uint64_t        epoch      = 0;

  bool Valid(util::TimePoint now, std::chrono::milliseconds skew = std::chrono::milliseconds::zero()) const {
    if (access_key_id.empty() && secret_access_key.empty() && session_token.empty()) {
      return false;
    }
    if (expires_at == util::TimePoint::max()) {
      return true;
    }
    return now + skew < expires_at;
  }
};

} // namespace swarm::credential
