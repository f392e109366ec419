#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const v4 = IP::parse("192.0.2.1");
  CHECK(v4);
  CHECK(v4->is_v4());
  CHECK_EQ(v4->as_string(), "192.0.2.1");
  CHECK_EQ(v4->to_address_literal(), "[192.0.2.1]");

  // Leading zeros are gone in the canonical form.
  CHECK_EQ(IP::parse("192.000.002.001")->as_string(), "192.0.2.1");

  auto const v6 = IP::parse("2001:0DB8:0000:0000:0000:0000:0000:0001");
  CHECK(v6);
  CHECK(v6->is_v6());
  CHECK_EQ(v6->as_string(), "2001:db8::1");
  CHECK_EQ(v6->to_address_literal(), "[IPv6:2001:db8::1]");
  CHECK_EQ(*v6, *IP::parse("2001:db8::1"));

  auto const mapped = IP::parse("::ffff:192.0.2.1");
  CHECK(mapped);
  CHECK(mapped->is_v6());
  CHECK_EQ(mapped->as_string(), "::ffff:192.0.2.1");
  CHECK_NE(*mapped, *v4);

  CHECK(!IP::parse(""));
  CHECK(!IP::parse("example.com"));
  CHECK(!IP::parse("[192.0.2.1]"));
  CHECK(!IP::parse("IPv6:2001:db8::1"));
  CHECK(!IP::parse("192.0.2"));
}
