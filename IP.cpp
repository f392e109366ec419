#include "IP.hpp"

#include <algorithm>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <glog/logging.h>

namespace IP {

Address::Address(IP4::octets const& addr)
  : ver_(version::v4)
{
  std::copy(begin(addr), end(addr), begin(bytes_));
}

Address::Address(IP6::octets const& addr)
  : ver_(version::v6)
{
  std::copy(begin(addr), end(addr), begin(bytes_));
}

std::string Address::as_string() const
{
  char bfr[INET6_ADDRSTRLEN];

  switch (ver_) {
  case version::v4: {
    in_addr a{};
    std::memcpy(&a, bytes_.data(), sizeof(a));
    CHECK_NOTNULL(inet_ntop(AF_INET, &a, bfr, sizeof(bfr)));
    break;
  }
  case version::v6: {
    in6_addr a{};
    std::memcpy(&a, bytes_.data(), sizeof(a));
    CHECK_NOTNULL(inet_ntop(AF_INET6, &a, bfr, sizeof(bfr)));
    break;
  }
  }

  return std::string{bfr};
}

std::string Address::to_address_literal() const
{
  if (is_v4())
    return IP4::to_address_literal(as_string());
  return IP6::to_address_literal(as_string());
}

std::optional<Address> parse(std::string_view addr)
{
  if (auto const a4 = IP4::to_octets(addr))
    return Address{*a4};
  if (auto const a6 = IP6::to_octets(addr))
    return Address{*a6};
  return {};
}
} // namespace IP
