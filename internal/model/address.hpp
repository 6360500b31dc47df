#pragma once

#include <string>
#include <string_view>

namespace vesting::model {

// Account identities are opaque strings, typically 0x-prefixed hex.
using Address = std::string;

// The null identity is empty, or nothing but zero digits with an
// optional 0x prefix.
inline bool IsNullAddress(std::string_view address) {
  if (address.size() >= 2 && address[0] == '0' && (address[1] == 'x' || address[1] == 'X')) {
    address.remove_prefix(2);
  }
  for (char c : address) {
    if (c != '0') {
      return false;
    }
  }
  return true;
}

} // namespace vesting::model
