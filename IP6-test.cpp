#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using IP6::is_address;
  using IP6::to_address_literal;
  using IP6::to_octets;

  CHECK(is_address("::1"));
  CHECK(is_address("::"));
  CHECK(!is_address("IPv6:::1"));
  CHECK(!is_address("[::1]"));

  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));

  CHECK(is_address("::ffff:0:0.0.0.0"));
  CHECK(is_address("::ffff:0:255.255.255.255"));

  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(is_address("1:2:3:4:5:6:7::"));
  CHECK(is_address("1::2:3"));
  CHECK(is_address("2001:DB8::1"));

  CHECK(!is_address(":::1"));
  CHECK(!is_address("1::2::3"));
  CHECK(!is_address("12345::1"));
  CHECK(!is_address("1:2:3:4:5:6:7:8:9"));
  CHECK(!is_address("::g"));
  CHECK(!is_address(""));

  auto const addr{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"};
  auto const addr_lit{"[IPv6:2001:0db8:85a3:0000:0000:8a2e:0370:7334]"};

  CHECK(is_address(addr));
  CHECK(!is_address(addr_lit));

  CHECK_EQ(to_address_literal(addr), addr_lit);

  auto const loopback = to_octets("::1");
  CHECK(loopback);
  CHECK((*loopback == IP6::octets{0, 0, 0, 0, 0, 0, 0, 0, //
                                  0, 0, 0, 0, 0, 0, 0, 1}));

  auto const doc = to_octets("2001:db8::1");
  CHECK(doc);
  CHECK(to_octets("2001:DB8:0:0:0:0:0:1") == doc);

  CHECK(!to_octets("[IPv6:::1]"));
  CHECK(!to_octets("not an address"));
}
