#include "mpcrec/protocol/types.hpp"

#include <stdexcept>

namespace mpcrec {

std::string Identity::ToString() const {
  return provider + ":" + subject;
}

Identity Identity::Parse(std::string_view canonical) {
  const size_t colon = canonical.find(':');
  if (colon == std::string_view::npos) {
    throw std::invalid_argument("identity must have the form provider:subject");
  }
  Identity out{std::string(canonical.substr(0, colon)), std::string(canonical.substr(colon + 1))};
  ValidateIdentity(out);
  return out;
}

void ValidateIdentity(const Identity& identity) {
  if (identity.provider.empty() || identity.subject.empty()) {
    throw std::invalid_argument("identity provider and subject must be non-empty");
  }
  if (identity.provider.find(':') != std::string::npos) {
    throw std::invalid_argument("identity provider must not contain ':'");
  }
}

}  // namespace mpcrec
