#include "IP4.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using IP4::is_address;
  using IP4::to_address_literal;
  using IP4::to_octets;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("160.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("255.0.0.0"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address("1.2.3.4.5"));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));

  // Leading zeros are fine, up to three digits.
  CHECK(is_address("001.001.001.001"));
  CHECK(is_address("01.01.01.01"));
  CHECK(is_address("000.000.000.000"));
  CHECK(!is_address("0001.0.0.0"));
  CHECK(!is_address("0000.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("260.0.0.0"));
  CHECK(!is_address("300.0.0.0"));
  CHECK(!is_address("1000.0.0.0"));

  CHECK(!is_address("1.256.0.0"));
  CHECK(!is_address("1.1.300.0"));
  CHECK(!is_address("1.1.1.256"));
  CHECK(!is_address("1.1.1.1000"));

  auto const addr     = "108.83.36.113";
  auto const addr_lit = "[108.83.36.113]";

  CHECK(is_address(addr));
  CHECK(!is_address(addr_lit));

  CHECK_EQ(to_address_literal(addr), addr_lit);

  auto const doc = to_octets("192.0.2.1");
  CHECK(doc);
  CHECK((*doc == IP4::octets{192, 0, 2, 1}));

  auto const zeros = to_octets("010.001.000.255");
  CHECK(zeros);
  CHECK((*zeros == IP4::octets{10, 1, 0, 255}));

  CHECK(!to_octets("256.0.0.1"));
  CHECK(!to_octets("[192.0.2.1]"));
  CHECK(!to_octets(""));
}
