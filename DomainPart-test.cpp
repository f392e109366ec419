#include "DomainPart.hpp"

#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<DomainPart> : ostream_formatter {};

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const dom = DomainPart::parse("example.org");
  CHECK(dom);
  CHECK(!dom->is_address_literal());
  CHECK_EQ(*dom, DomainPart{DomainPart::Domain{"example.org"}});
  CHECK_EQ(dom->as_string(), "example.org");
  CHECK((dom->labels() == std::vector<std::string>{"example", "org"}));

  CHECK(DomainPart::parse("localhost"));
  CHECK(DomainPart::parse("a.b-c.d"));
  CHECK(DomainPart::parse("foo--bar.example"));
  CHECK(DomainPart::parse("123.example"));
  CHECK_EQ(fmt::format("{}", DomainPart{"MiXeD.Example"}), "MiXeD.Example");

  // No leading or trailing hyphen in a label.
  CHECK(!DomainPart::parse("foo-.example.org"));
  CHECK(!DomainPart::parse("-foo.example.org"));
  CHECK(!DomainPart::parse("example..org"));
  CHECK(!DomainPart::parse("example.org."));
  CHECK(!DomainPart::parse(".example.org"));
  CHECK(!DomainPart::parse("exa_mple.org"));
  CHECK(!DomainPart::parse(""));

  // Without brackets, an address is just a domain made of digits.
  auto const bare = DomainPart::parse("192.0.2.1");
  CHECK(bare);
  CHECK(!bare->is_address_literal());

  auto const lit = DomainPart::parse("[192.0.2.1]");
  CHECK(lit);
  CHECK(lit->is_address_literal());
  CHECK_EQ(std::get<AddressLiteral>(lit->value()),
           AddressLiteral{*IP::parse("192.0.2.1")});
  CHECK(lit->labels().empty());
  CHECK_EQ(lit->as_string(), "[192.0.2.1]");

  CHECK(DomainPart::parse("[IPv6:::1]"));
  CHECK(DomainPart::parse("[x400:cn=bob]"));

  // A free-form literal is no domain.
  CHECK(!DomainPart::parse("[somewhere]"));
  CHECK(!DomainPart::parse("[300.1.1.1]"));
  CHECK(!DomainPart::parse("[192.0.2.1"));

  auto threw = false;
  try {
    DomainPart bad{"bad-.example"};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);
}
