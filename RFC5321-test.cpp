#include "RFC5321.hpp"

#include <string_view>

#include <glog/logging.h>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::seq;

namespace {
template <typename Rule>
bool matches(std::string_view input)
{
  memory_input<> in{input.data(), input.size(), "test"};
  return tao::pegtl::parse<seq<Rule, eof>>(in);
}

template <typename Rule>
bool matches_byte(int byte)
{
  char const ch = static_cast<char>(byte);
  return matches<Rule>(std::string_view{&ch, 1});
}

bool is_alnum(int c)
{
  return ('0' <= c && c <= '9') || ('A' <= c && c <= 'Z')
         || ('a' <= c && c <= 'z');
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Every byte against each class, so an off-by-one shows up here.
  for (auto c = 0; c < 256; ++c) {
    CHECK_EQ(matches_byte<RFC5321::esmtp_value_char>(c),
             (33 <= c && c <= 60) || (62 <= c && c <= 126))
        << "byte " << c;

    CHECK_EQ(matches_byte<RFC5321::qtextSMTP>(c),
             (32 <= c && c <= 33) || (35 <= c && c <= 91)
                 || (93 <= c && c <= 126))
        << "byte " << c;

    CHECK_EQ(matches_byte<RFC5321::dcontent>(c),
             (33 <= c && c <= 90) || (94 <= c && c <= 126))
        << "byte " << c;

    char const pair[] = {'\\', static_cast<char>(c)};
    CHECK_EQ(matches<RFC5321::quoted_pairSMTP>(std::string_view{pair, 2}),
             32 <= c && c <= 126)
        << "byte " << c;

    CHECK_EQ(matches_byte<RFC5321::let_dig>(c), is_alnum(c)) << "byte " << c;
    CHECK_EQ(matches_byte<RFC5321::esmtp_keyword>(c), is_alnum(c))
        << "byte " << c;
  }

  CHECK(!matches_byte<Chars::atext>('"'));
  CHECK(!matches_byte<Chars::atext>('.'));
  CHECK(!matches_byte<Chars::atext>('@'));
  CHECK(!matches_byte<Chars::atext>(0xC3));
  CHECK(matches_byte<Chars::atext>('+'));
  CHECK(matches_byte<Chars::atext>('~'));

  CHECK(matches<RFC5321::ldh_str>("a"));
  CHECK(matches<RFC5321::ldh_str>("a-b"));
  CHECK(matches<RFC5321::ldh_str>("a--b"));
  CHECK(matches<RFC5321::ldh_str>("0day"));
  CHECK(!matches<RFC5321::ldh_str>("a-"));
  CHECK(!matches<RFC5321::ldh_str>("-a"));
  CHECK(!matches<RFC5321::ldh_str>(""));

  CHECK(matches<RFC5321::domain>("example.org"));
  CHECK(!matches<RFC5321::domain>("foo-.example.org"));
  CHECK(!matches<RFC5321::domain>("example..org"));
  CHECK(!matches<RFC5321::domain>("example.org."));

  CHECK(matches<RFC5321::IPv4_address_literal>("192.0.2.1"));
  CHECK(!matches<RFC5321::IPv4_address_literal>("192.0.2.256"));

  CHECK(matches<RFC5321::esmtp_params>("SIZE=1000 BODY=8BITMIME"));
  CHECK(matches<RFC5321::esmtp_params>("A\t \tB"));
  CHECK(!matches<RFC5321::esmtp_params>("A "));

  CHECK_EQ(RFC5321::unquote("\"\""), "");
  CHECK_EQ(RFC5321::unquote("\"a\\\"b\\\\c\""), "a\"b\\c");
  CHECK_EQ(RFC5321::unquote("\"\\x\""), "x");
}
