#include "IP4.hpp"

#include <charconv>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// Any value 0-255 in one to three digits, leading zeros allowed.

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};

// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet, eof> {
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<dec_octet> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& a)
  {
    a.push_back(in.string());
  }
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return tao::pegtl::parse<ipv4_address>(in);
}

auto to_address_literal(std::string_view addr) -> std::string
{
  CHECK(is_address(addr));
  return fmt::format("{}{}{}", lit_pfx, addr, lit_sfx);
}

auto to_octets(std::string_view addr) -> std::optional<octets>
{
  std::vector<std::string> a;
  a.reserve(4);

  memory_input<> in{addr.data(), addr.size(), "addr"};
  if (!tao::pegtl::parse<ipv4_address, action>(in, a))
    return {};

  CHECK_EQ(a.size(), 4u);

  octets ret{};
  for (size_t i = 0; i < ret.size(); ++i) {
    auto const [ptr, ec]
        = std::from_chars(a[i].data(), a[i].data() + a[i].size(), ret[i]);
    if (ec != std::errc{} || ptr != a[i].data() + a[i].size())
      return {};
  }
  return ret;
}
} // namespace IP4
