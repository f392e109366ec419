#ifndef RFC5321_DOT_HPP
#define RFC5321_DOT_HPP

// The envelope grammar of <https://tools.ietf.org/html/rfc5321>, with the
// actions that build values from it.  Only included by the .cpp files that
// run a parse.

#include "AddressLiteral.hpp"
#include "DomainPart.hpp"
#include "EsmtpParam.hpp"
#include "IP.hpp"
#include "LocalPart.hpp"
#include "Mailbox.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

namespace Chars {
using tao::pegtl::one;
using tao::pegtl::sor;

using tao::pegtl::abnf::ALPHA;
using tao::pegtl::abnf::DIGIT;

// clang-format off

// excluded from atext: "(),.@[]" and everything non-ASCII
struct atext : sor<ALPHA, DIGIT,
                   one<'!', '#',
                       '$', '%',
                       '&', '\'',
                       '*', '+',
                       '-', '/',
                       '=', '?',
                       '^', '_',
                       '`', '{',
                       '|', '}',
                       '~'>> {};

// clang-format on
} // namespace Chars

namespace RFC5321 {
using tao::pegtl::eof;
using tao::pegtl::list;
using tao::pegtl::memory_input;
using tao::pegtl::not_one;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::plus;
using tao::pegtl::range;
using tao::pegtl::ranges;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::star;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::ALPHA;
using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;
using tao::pegtl::abnf::SP;
using tao::pegtl::abnf::WSP;

using dot   = one<'.'>;
using colon = one<':'>;
using dash  = one<'-'>;

// clang-format off

// 4.1.2.  Command Argument Syntax

struct let_dig : sor<ALPHA, DIGIT> {};

// No trailing hyphen: every run of '-' must be followed by a let-dig.
struct ldh_tail : star<sor<seq<plus<dash>, let_dig>, let_dig>> {};

struct ldh_str : seq<let_dig, ldh_tail> {};

struct label : ldh_str {};

struct domain : list<label, dot> {};

struct at_domain : seq<one<'@'>, domain> {};

struct a_d_l : list<at_domain, one<','>> {};

// 4.1.3.  Address Literals

struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};

struct IPv4_address_literal : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {};

struct h16 : rep_min_max<1, 4, HEXDIG> {};

struct ls32 : sor<seq<h16, colon, h16>, IPv4_address_literal> {};

struct dcolon : two<':'> {};

struct IPv6address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                         seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                         seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                         seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                         seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                         seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                         seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                         seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                         seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};

struct IPv6_address_literal : seq<TAO_PEGTL_ISTRING("IPv6:"), IPv6address> {};

struct dcontent : ranges<33, 90, 94, 126> {};

struct standardized_tag : ldh_str {};

struct general_address_literal : seq<standardized_tag, colon, plus<dcontent>> {};

// The terminator goes inside each alternative, so a formal literal that
// only matches a prefix falls through to the next one.
template <typename End>
struct address_literal_content : sor<seq<IPv4_address_literal, End>,
                                     seq<IPv6_address_literal, End>,
                                     seq<general_address_literal, End>> {};

struct address_literal : seq<one<'['>, address_literal_content<one<']'>>> {};

struct free_form_text : star<not_one<'[', ']'>> {};

// 4.1.2.  Local-part

struct qtextSMTP : ranges<32, 33, 35, 91, 93, 126> {};
struct graphic : range<32, 126> {};
struct quoted_pairSMTP : seq<one<'\\'>, graphic> {};
struct qcontentSMTP : sor<qtextSMTP, quoted_pairSMTP> {};

struct atom : plus<Chars::atext> {};
struct dot_string : list<atom, dot> {};
struct quoted_string : seq<one<'"'>, star<qcontentSMTP>, one<'"'>> {};
struct local_part : sor<dot_string, quoted_string> {};
struct non_local_part : sor<domain, address_literal> {};
struct mailbox : seq<local_part, one<'@'>, non_local_part> {};

struct path : seq<one<'<'>, opt<a_d_l, colon>, mailbox, one<'>'>> {};

struct null_path : string<'<', '>'> {};

struct reverse_path : sor<null_path, path> {};

struct magic_postmaster : TAO_PEGTL_ISTRING("<postmaster>") {};

struct forward_path : sor<magic_postmaster, path> {};

// 4.1.2.  esmtp parameters

struct esmtp_keyword : plus<sor<ALPHA, DIGIT>> {};

struct esmtp_value_char : ranges<33, 60, 62, 126> {};

struct esmtp_value : plus<esmtp_value_char> {};

struct esmtp_param : seq<esmtp_keyword, opt<one<'='>, esmtp_value>> {};

struct esmtp_params : list<esmtp_param, plus<WSP>> {};

// 4.1.1.2. and 4.1.1.3.

struct mail_from : seq<TAO_PEGTL_ISTRING("MAIL FROM:"),
                       reverse_path,
                       opt<SP, esmtp_params>> {};

struct rcpt_to : seq<TAO_PEGTL_ISTRING("RCPT TO:"),
                     forward_path,
                     opt<SP, esmtp_params>> {};

// Entry points, all of the input or nothing.

struct local_part_only : seq<local_part, eof> {};
struct domain_part_only : seq<non_local_part, eof> {};
struct mailbox_only : seq<mailbox, eof> {};
struct forward_path_only : seq<forward_path, eof> {};
struct reverse_path_only : seq<reverse_path, eof> {};
struct esmtp_params_only : seq<opt<esmtp_params>, eof> {};
struct mail_from_only : seq<mail_from, eof> {};
struct rcpt_to_only : seq<rcpt_to, eof> {};

struct address_literal_only
  : seq<one<'['>,
        sor<address_literal_content<seq<one<']'>, eof>>,
            seq<free_form_text, one<']'>, eof>>> {};

struct address_literal_upgrade : address_literal_content<eof> {};

// clang-format on

// Values built by the actions.  Actions fire as soon as their rule
// matches, even if an enclosing rule later fails, so each field is only
// read by the action of a rule that contains the one that set it.

struct Ctx {
  std::optional<LocalPart>      local;
  std::optional<AddressLiteral> literal;
  std::optional<DomainPart>     domain;
  std::optional<Mailbox>        mbx;

  bool null_path{false};
  bool postmaster{false};

  EsmtpParams parameters;
};

// Remove the quotes and the backslash of each quoted-pair.
inline std::string unquote(std::string_view quoted)
{
  CHECK_GE(quoted.size(), 2u);
  quoted.remove_prefix(1);
  quoted.remove_suffix(1);

  std::string ret;
  ret.reserve(quoted.size());
  for (size_t i = 0; i < quoted.size(); ++i) {
    if (quoted[i] == '\\' && i + 1 < quoted.size())
      ++i;
    ret += quoted[i];
  }
  return ret;
}

// Actions

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<dot_string> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    ctx.local.emplace(LocalPart::types::dot_string, in.string());
  }
};

template <>
struct action<quoted_string> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    ctx.local.emplace(LocalPart::types::quoted_string, unquote(in.string()));
  }
};

// The conversions from text can refuse what the grammar accepted, and that
// is a local failure of the rule, same as a syntax error.

template <>
struct action<IPv4_address_literal> {
  template <typename Input>
  static bool apply(Input const& in, Ctx& ctx)
  {
    auto const addr = IP4::to_octets(in.string());
    if (!addr)
      return false;
    ctx.literal.emplace(IP::Address{*addr});
    return true;
  }
};

template <>
struct action<IPv6_address_literal> {
  template <typename Input>
  static bool apply(Input const& in, Ctx& ctx)
  {
    auto const text = in.string();
    auto const addr = IP6::to_octets(std::string_view{text}.substr(IP6::tag_sz));
    if (!addr)
      return false;
    ctx.literal.emplace(IP::Address{*addr});
    return true;
  }
};

template <>
struct action<general_address_literal> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    auto const text  = in.string();
    auto const colon = text.find(':');
    CHECK_NE(colon, std::string::npos);
    ctx.literal.emplace(AddressLiteral::Tagged{text.substr(0, colon),
                                               text.substr(colon + 1)});
  }
};

template <>
struct action<free_form_text> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    ctx.literal.emplace(AddressLiteral::FreeForm{in.string()});
  }
};

template <>
struct action<non_local_part> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    if (in.peek_char() == '[') {
      CHECK(ctx.literal);
      ctx.domain.emplace(*ctx.literal);
    }
    else {
      ctx.domain.emplace(DomainPart::Domain{in.string()});
    }
  }
};

template <>
struct action<mailbox> {
  static void apply0(Ctx& ctx)
  {
    CHECK(ctx.local);
    CHECK(ctx.domain);
    ctx.mbx.emplace(*ctx.local, *ctx.domain);
  }
};

template <>
struct action<null_path> {
  static void apply0(Ctx& ctx) { ctx.null_path = true; }
};

template <>
struct action<magic_postmaster> {
  static void apply0(Ctx& ctx) { ctx.postmaster = true; }
};

template <>
struct action<esmtp_param> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    auto const text = in.string();
    auto const eq   = text.find('=');
    if (eq == std::string::npos) {
      ctx.parameters.push_back(EsmtpParam{text, std::nullopt});
    }
    else {
      ctx.parameters.push_back(
          EsmtpParam{text.substr(0, eq), text.substr(eq + 1)});
    }
  }
};

template <typename Rule>
bool parse_all(std::string_view input, char const* source, Ctx& ctx)
{
  memory_input<> in{input.data(), input.size(), source};
  if (tao::pegtl::parse<Rule, action>(in, ctx))
    return true;
  VLOG(1) << "failed to parse «" << input << "» as " << source;
  return false;
}

} // namespace RFC5321

#endif // RFC5321_DOT_HPP
