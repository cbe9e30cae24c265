#include "process_identity_provider.hpp"

#include <sys/wait.h>

#include <google/protobuf/util/json_util.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "swarm/v1/credentials.pb.h"

namespace swarm::credential {

namespace {

void ValidateProfile(const std::string& profile) {
  if (profile.empty()) {
    throw util::AuthRefreshError("credential profile must not be empty");
  }
  for (unsigned char c : profile) {
    if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') {
      throw util::AuthRefreshError("credential profile contains an unsupported character: " + profile);
    }
  }
}

std::string Expand(const std::string& command, const std::string& profile) {
  static constexpr char kPlaceholder[] = "{profile}";

  std::string out = command;
  for (auto pos = out.find(kPlaceholder); pos != std::string::npos; pos = out.find(kPlaceholder, pos + profile.size())) {
    out.replace(pos, sizeof(kPlaceholder) - 1, profile);
  }
  return out;
}

// Runs `command` through /bin/sh and returns its stdout.
std::string RunCommand(const std::string& command) {
  FILE* pipe = ::popen(command.c_str(), "r");
  if (!pipe) {
    throw util::AuthRefreshError("cannot start identity command: " + command);
  }

  std::string              output;
  std::array<char, 4096>   buf{};
  size_t                   n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    output.append(buf.data(), n);
  }

  const int status = ::pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    throw util::AuthRefreshError("identity command failed (exit " + std::to_string(code) + "): " + command);
  }
  return output;
}

// Runs `command` with the caller's terminal: an interactive login has to
// show its device code and URL to the operator.
void RunInteractive(const std::string& command) {
  std::fflush(stdout);
  const int status = std::system(command.c_str());
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    throw util::AuthRefreshError("login command failed (exit " + std::to_string(code) + "): " + command);
  }
}

} // namespace

ProcessIdentityProvider::ProcessIdentityProvider(std::string authenticate_command, std::string renew_command)
    : authenticate_command_(std::move(authenticate_command)), renew_command_(std::move(renew_command)) {
}

Credential ProcessIdentityProvider::ParseProcessCredentials(const std::string& json) {
  swarm::v1::ProcessCredentials document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &document, options);
  if (!status.ok()) {
    throw util::AuthRefreshError("identity command printed invalid credentials: " + std::string(status.message()));
  }
  if (document.version() != 1) {
    throw util::AuthRefreshError("unsupported credential document version " + std::to_string(document.version()));
  }
  if (document.access_key_id().empty() || document.secret_access_key().empty()) {
    throw util::AuthRefreshError("identity command returned no access key");
  }

  Credential credential;
  credential.access_key_id     = document.access_key_id();
  credential.secret_access_key = document.secret_access_key();
  credential.session_token     = document.session_token();
  if (!document.expiration().empty()) {
    try {
      credential.expires_at = util::ParseRfc3339(document.expiration());
    } catch (const std::invalid_argument& e) {
      throw util::AuthRefreshError(e.what());
    }
  }
  return credential;
}

Credential ProcessIdentityProvider::Authenticate(const std::string& profile) {
  ValidateProfile(profile);
  return ParseProcessCredentials(RunCommand(Expand(authenticate_command_, profile)));
}

Credential ProcessIdentityProvider::Renew(const std::string& profile) {
  ValidateProfile(profile);
  if (renew_command_.empty()) {
    return Authenticate(profile);
  }

  // The login session usually outlives the credentials it issues; only log
  // in again when it can no longer produce a live credential.
  try {
    auto credential = Authenticate(profile);
    if (credential.expires_at > util::Now()) {
      return credential;
    }
    SWARM_LOG_WARN("Identity command returned expired credentials", {observability::StringField("profile", profile)});
  } catch (const util::AuthRefreshError& e) {
    SWARM_LOG_WARN("Credential export failed, logging in again",
                   {observability::StringField("profile", profile), observability::StringField("error", e.what())});
  }

  RunInteractive(Expand(renew_command_, profile));
  SWARM_LOG_INFO("Login completed", {observability::StringField("profile", profile)});
  return Authenticate(profile);
}

} // namespace swarm::credential
