#include "AddressLiteral.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<AddressLiteral> : ostream_formatter {};

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const ip4 = AddressLiteral::parse("[192.0.2.1]");
  CHECK(ip4);
  CHECK(ip4->is_ip());
  CHECK_EQ(*ip4, AddressLiteral{*IP::parse("192.0.2.1")});
  CHECK_EQ(ip4->as_string(), "[192.0.2.1]");
  CHECK_EQ(fmt::format("{}", *ip4), "[192.0.2.1]");

  auto const ip6 = AddressLiteral::parse("[IPv6:2001:db8::1]");
  CHECK(ip6);
  CHECK(ip6->is_ip());
  CHECK_EQ(*ip6, AddressLiteral{*IP::parse("2001:db8::1")});
  CHECK_EQ(ip6->as_string(), "[IPv6:2001:db8::1]");

  // The tag is case-insensitive, and the address comes out canonical.
  auto const ip6_upper = AddressLiteral::parse("[IPV6:2001:DB8:0::0001]");
  CHECK(ip6_upper);
  CHECK_EQ(*ip6_upper, *ip6);
  CHECK_EQ(ip6_upper->as_string(), "[IPv6:2001:db8::1]");

  // An IPv4 tail matches the IPv4 rule first; the result is still IPv6.
  auto const mapped = AddressLiteral::parse("[IPv6:::ffff:192.0.2.1]");
  CHECK(mapped);
  CHECK(mapped->is_ip());
  CHECK_EQ(*mapped, AddressLiteral{*IP::parse("::ffff:192.0.2.1")});
  CHECK(std::get<IP::Address>(mapped->value()).is_v6());
  CHECK_EQ(mapped->as_string(), "[IPv6:::ffff:192.0.2.1]");

  // inet_pton() won't take leading zeros in the IPv4 tail, so this one
  // is only a general literal with an "IPv6" tag.
  auto const zeros = AddressLiteral::parse("[IPv6:::ffff:192.000.2.1]");
  CHECK(zeros);
  CHECK(zeros->is_tagged());
  CHECK_EQ(*zeros, (AddressLiteral{AddressLiteral::Tagged{
                       "IPv6", "::ffff:192.000.2.1"}}));

  // Not an address at all, same thing.
  CHECK_EQ(*AddressLiteral::parse("[IPv6:zzz]"),
           (AddressLiteral{AddressLiteral::Tagged{"IPv6", "zzz"}}));

  auto const x400 = AddressLiteral::parse("[x400:cn=bob,dc=example,dc=org]");
  CHECK(x400);
  CHECK(x400->is_tagged());
  CHECK_EQ(*x400, (AddressLiteral{AddressLiteral::Tagged{
                      "x400", "cn=bob,dc=example,dc=org"}}));
  CHECK_EQ(x400->as_string(), "[x400:cn=bob,dc=example,dc=org]");

  // Brackets around anything else make a free-form literal.
  auto const somewhere = AddressLiteral::parse("[somewhere]");
  CHECK(somewhere);
  CHECK(somewhere->is_free_form());
  CHECK_EQ(*somewhere, AddressLiteral{AddressLiteral::FreeForm{"somewhere"}});
  CHECK_EQ(somewhere->as_string(), "[somewhere]");

  CHECK(AddressLiteral::parse("[300.1.1.1]")->is_free_form());
  CHECK(AddressLiteral::parse("[foo-:bar]")->is_free_form());
  CHECK(AddressLiteral::parse("[x400:a b]")->is_free_form());
  CHECK(AddressLiteral::parse("[1.2.3.4 ]")->is_free_form());
  CHECK_EQ(AddressLiteral::parse("[]")->as_string(), "[]");

  // The brackets are required, and nothing may follow.
  CHECK(!AddressLiteral::parse(""));
  CHECK(!AddressLiteral::parse("192.0.2.1"));
  CHECK(!AddressLiteral::parse("[192.0.2.1"));
  CHECK(!AddressLiteral::parse("192.0.2.1]"));
  CHECK(!AddressLiteral::parse("[192.0.2.1]x"));
  CHECK(!AddressLiteral::parse("[a[b]"));
  CHECK(!AddressLiteral::parse("[a]b]"));

  auto threw = false;
  try {
    AddressLiteral bad{"[unterminated"};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  CHECK_EQ(AddressLiteral{"[192.0.2.1]"}, *ip4);

  // upgrade()

  AddressLiteral const ff_ip4{AddressLiteral::FreeForm{"192.0.2.1"}};
  auto const up_ip4 = ff_ip4.upgrade();
  CHECK(up_ip4);
  CHECK_EQ(*up_ip4, *ip4);
  CHECK(ff_ip4.is_free_form()); // untouched

  AddressLiteral const ff_ip6{AddressLiteral::FreeForm{"IPV6:2001:DB8::1"}};
  auto const up_ip6 = ff_ip6.upgrade();
  CHECK(up_ip6);
  CHECK_EQ(*up_ip6, *ip6);

  AddressLiteral const ff_tag{AddressLiteral::FreeForm{"x400:cn=bob"}};
  auto const up_tag = ff_tag.upgrade();
  CHECK(up_tag);
  CHECK_EQ(*up_tag,
           (AddressLiteral{AddressLiteral::Tagged{"x400", "cn=bob"}}));

  AddressLiteral const ff_none{AddressLiteral::FreeForm{"somewhere"}};
  CHECK(!ff_none.upgrade());
  CHECK_EQ(ff_none, *somewhere);

  CHECK(!AddressLiteral{AddressLiteral::FreeForm{""}}.upgrade());
  CHECK(!AddressLiteral{AddressLiteral::FreeForm{"192.0.2.1 "}}.upgrade());
  CHECK(!AddressLiteral{AddressLiteral::FreeForm{"[192.0.2.1]"}}.upgrade());

  // Only a free-form literal can be upgraded.
  CHECK(!ip4->upgrade());
  CHECK(!x400->upgrade());
}
