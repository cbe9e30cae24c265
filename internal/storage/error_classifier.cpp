#include "error_classifier.hpp"

#include <array>
#include <cctype>
#include <string>

namespace swarm::storage {

namespace {

using swarm::v1::ErrorCategory;

struct Pattern {
  const char*   needle;
  ErrorCategory category;
};

// Matched against the message with case, spaces, '_' and '-' removed, so
// "NoSuchKey", "NO_SUCH_KEY" and "no such key" are one pattern. Checked in
// order; auth and not-found codes come before the generic network patterns
// because their messages often mention the endpoint.
constexpr std::array<Pattern, 25> kPatterns = {{
    {"expiredtoken", swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED},
    {"tokenrefreshrequired", swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED},
    {"requestexpired", swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED},
    {"signaturedoesnotmatch", swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED},
    {"nosuchkey", swarm::v1::ERROR_CATEGORY_NOT_FOUND},
    {"nosuchbucket", swarm::v1::ERROR_CATEGORY_NOT_FOUND},
    {"resourcenotfound", swarm::v1::ERROR_CATEGORY_NOT_FOUND},
    {"pathdoesnotexist", swarm::v1::ERROR_CATEGORY_NOT_FOUND},
    {"http404", swarm::v1::ERROR_CATEGORY_NOT_FOUND},
    {"accessdenied", swarm::v1::ERROR_CATEGORY_ACCESS_DENIED},
    {"invalidaccesskeyid", swarm::v1::ERROR_CATEGORY_ACCESS_DENIED},
    {"http403", swarm::v1::ERROR_CATEGORY_ACCESS_DENIED},
    {"requesttimeout", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"requesttimetooskewed", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"serviceunavailable", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"slowdown", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"internalerror", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"internalfailure", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"truncated", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"connect", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"timeout", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"timedout", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"network", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"ssl", swarm::v1::ERROR_CATEGORY_TRANSIENT},
    {"certificate", swarm::v1::ERROR_CATEGORY_TRANSIENT},
}};

std::string Compact(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == ' ' || c == '_' || c == '-') continue;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace

ErrorCategory ClassifyStorageError(std::string_view message) {
  const auto compact = Compact(message);
  for (const auto& pattern : kPatterns) {
    if (compact.find(pattern.needle) != std::string::npos) {
      return pattern.category;
    }
  }
  return swarm::v1::ERROR_CATEGORY_UNKNOWN;
}

bool IsRetryable(ErrorCategory category) {
  return category == swarm::v1::ERROR_CATEGORY_TRANSIENT || category == swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED;
}

const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case swarm::v1::ERROR_CATEGORY_NONE:
      return "none";
    case swarm::v1::ERROR_CATEGORY_TRANSIENT:
      return "transient";
    case swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED:
      return "auth_expired";
    case swarm::v1::ERROR_CATEGORY_NOT_FOUND:
      return "not_found";
    case swarm::v1::ERROR_CATEGORY_ACCESS_DENIED:
      return "access_denied";
    case swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION:
      return "invalid_destination";
    default:
      return "unknown";
  }
}

} // namespace swarm::storage
