#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include "IP4.hpp"
#include "IP6.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace IP {

// A binary IPv4 or IPv6 address.  IPv4 addresses use the first four
// bytes, the rest stay zero.

class Address {
public:
  enum class version : uint8_t { v4, v6 };

  explicit Address(IP4::octets const& addr);
  explicit Address(IP6::octets const& addr);

  bool    is_v4() const { return ver_ == version::v4; }
  bool    is_v6() const { return ver_ == version::v6; }

  // Canonical text form, as from inet_ntop().
  std::string as_string() const;

  // [192.0.2.1] or [IPv6:2001:db8::1]
  std::string to_address_literal() const;

  bool operator==(Address const& rhs) const = default;

private:
  version                  ver_;
  std::array<uint8_t, 16> bytes_{};
};

inline std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  return os << addr.as_string();
}

// Bare address text, no brackets: IPv4 first, then IPv6.
std::optional<Address> parse(std::string_view addr);
} // namespace IP

#endif // IP_DOT_HPP
