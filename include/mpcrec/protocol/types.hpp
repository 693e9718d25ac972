#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mpcrec {

using PartyIndex = uint32_t;

// (provider, subject) pair taken from a verified OAuth token.
struct Identity {
  std::string provider;
  std::string subject;

  // "<provider>:<subject>"
  std::string ToString() const;
  static Identity Parse(std::string_view canonical);

  bool operator==(const Identity& other) const = default;
};

// Throws std::invalid_argument for empty fields or a ':' in the provider.
void ValidateIdentity(const Identity& identity);

}  // namespace mpcrec
