#include "Mailbox.hpp"

#include <iostream>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <boost/lexical_cast.hpp>

template <>
struct fmt::formatter<Mailbox> : ostream_formatter {};

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox dg0{"gene@digilicious.com"};
  Mailbox dg1{LocalPart{"gene"}, DomainPart{"digilicious.com"}};

  CHECK_EQ(dg0, dg1);

  CHECK_EQ(std::string("digilicious.com"), dg0.domain().as_string());
  CHECK_EQ(std::string("gene"), dg0.local_part().text());

  auto dgstr = static_cast<std::string>(dg0);
  CHECK_EQ(dgstr, "gene@digilicious.com");
  CHECK_EQ(boost::lexical_cast<std::string>(dg0), "gene@digilicious.com");
  CHECK_EQ(fmt::format("<{}>", dg0), "<gene@digilicious.com>");

  auto threw = false;
  try {
    Mailbox bad("should throw@example.com");
  }
  catch (std::exception& e) {
    threw = true;
  }
  CHECK(threw);

  CHECK(Mailbox::validate("simple@example.com"));
  CHECK(Mailbox::validate("very.common@example.com"));
  CHECK(Mailbox::validate("disposable.style.email.with+symbol@example.com"));
  CHECK(Mailbox::validate("other.email-with-hyphen@example.com"));
  CHECK(Mailbox::validate("fully-qualified-domain@example.com"));

  // (may go to user.name@example.com inbox depending on mail server)
  CHECK(Mailbox::validate("user.name+tag+sorting@example.com"));

  CHECK(Mailbox::validate("x@example.com"));
  CHECK(Mailbox::validate("example-indeed@strange-example.com"));

  CHECK(Mailbox::validate("example@s.example"));

  // (space between the quotes)
  CHECK(Mailbox::validate("\" \"@example.org"));

  // (quoted angle brackets)
  CHECK(Mailbox::validate("\"\\<foo-bar\\>\"@example.org"));

  // (quoted double dot)
  CHECK(Mailbox::validate("\"john..doe\"@example.org"));

  // (bangified host route used for uucp mailers)
  CHECK(Mailbox::validate("mailhost!username@example.org"));

  // (% escaped mail route to user@example.com via example.org)
  CHECK(Mailbox::validate("user%example.com@example.org"));

  // Not fully qualified, but that's not a syntax problem.
  CHECK(Mailbox::validate("foo@bar"));

  // Address literals
  CHECK(Mailbox::validate("a@[192.0.2.1]"));
  CHECK(Mailbox::validate("a@[IPv6:2001:db8::1]"));
  CHECK(Mailbox::validate("a@[IPv6:::ffff:192.0.2.1]"));
  CHECK(Mailbox::validate("a@[x400:cn=bob,dc=example]"));

  // No length limits at this level.
  CHECK(Mailbox::validate(
      "1234567890123456789012345678901234567890123456789012345"
      "678901234+x@example.com"));

  // Invalid email addresses

  CHECK(!Mailbox::validate(""));
  CHECK(!Mailbox::validate("@example.com"));
  CHECK(!Mailbox::validate("a@"));
  CHECK(!Mailbox::validate("Abc.example.com")); // (no @ character)
  CHECK(!Mailbox::validate("postmaster"));

  CHECK(!Mailbox::validate("A@b@c@example.com")); // (only one @ is allowed)

  // (none of the special characters in this local-part are allowed
  // outside quotation marks)
  CHECK(!Mailbox::validate("a\"b(c)d,e:f;g<h>i[j\\k]l@example.com"));

  // (quoted strings must be dot separated or the only element making
  // up the local-part)
  CHECK(!Mailbox::validate("just\"not\"right@example.com"));

  // (spaces, quotes, and backslashes may only exist when within
  // quoted strings and preceded by a backslash)
  CHECK(!Mailbox::validate("this is\"not\\allowed@example.com"));

  // (even if escaped (preceded by a backslash), spaces, quotes, and
  // backslashes must still be contained by quotes)
  CHECK(!Mailbox::validate("this\\ still\\\"not\\\\allowed@example.com"));

  // (label ends in a hyphen, and it's no address literal either)
  CHECK(!Mailbox::validate("foo@foo-.example.org"));

  CHECK(!Mailbox::validate("a@example.com."));
  CHECK(!Mailbox::validate("a@[somewhere]"));
  CHECK(!Mailbox::validate("a@[192.0.2.1"));
  CHECK(!Mailbox::validate("\"a@example.com"));
  CHECK(!Mailbox::validate("<a@example.com>"));
  CHECK(!Mailbox::validate("a@example.com "));
  CHECK(!Mailbox::validate("\xC3\xA9@example.com"));

  // Parse results

  auto const lit = Mailbox::parse("a@[192.0.2.1]");
  CHECK(lit);
  CHECK(lit->domain().is_address_literal());
  CHECK_EQ(lit->as_string(), "a@[192.0.2.1]");

  auto const v6 = Mailbox::parse("a@[ipv6:2001:DB8::1]");
  CHECK(v6);
  CHECK_EQ(v6->as_string(), "a@[IPv6:2001:db8::1]");

  auto const mapped = Mailbox::parse("a@[IPv6:::ffff:192.0.2.1]");
  CHECK(mapped);
  CHECK_EQ(mapped->as_string(), "a@[IPv6:::ffff:192.0.2.1]");

  auto const quoted = Mailbox::parse("\"a\\\"b\\\\c\"@example.org");
  CHECK(quoted);
  CHECK(quoted->local_part().is_quoted());
  CHECK_EQ(quoted->local_part().text(), "a\"b\\c");
  CHECK_EQ(quoted->as_string(), "\"a\\\"b\\\\c\"@example.org");
  CHECK_EQ(*Mailbox::parse(quoted->as_string()), *quoted);

  CHECK_EQ(Mailbox{"\"\\a\\.\\.\\b\"@foo.bar"}, Mailbox{"\"a..b\"@foo.bar"});
  CHECK_NE(Mailbox{"\"a.b\"@foo.bar"}, Mailbox{"a.b@foo.bar"});

  CHECK(!Mailbox::parse("Abc.example.com"));
}
