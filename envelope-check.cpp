// Parse envelope command arguments from the command line or stdin and
// print them back in canonical form.

#include <gflags/gflags.h>
namespace gflags {
}

DEFINE_string(rule,
              "mailbox",
              "grammar to apply: mailbox, literal, params, mail, rcpt, path, "
              "reverse-path");

DEFINE_bool(upgrade, false, "try to upgrade free-form address literals");

DEFINE_bool(strip_crlf, true, "strip a trailing CR and LF before parsing");

#include "AddressLiteral.hpp"
#include "Command.hpp"
#include "EsmtpParam.hpp"
#include "Mailbox.hpp"
#include "Path.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
std::string join(EsmtpParams const& params)
{
  std::string ret;
  for (auto const& param : params) {
    ret += ' ';
    ret += param.as_string();
  }
  return ret;
}

std::optional<std::string> check_literal(std::string_view input)
{
  auto lit = AddressLiteral::parse(input);
  if (!lit)
    return {};
  if (FLAGS_upgrade && lit->is_free_form()) {
    if (auto up = lit->upgrade())
      return up->as_string();
    LOG(INFO) << "«" << input << "» is not upgradable";
  }
  return lit->as_string();
}

std::optional<std::string> check(std::string_view input)
{
  if (FLAGS_rule == "mailbox") {
    if (auto const mbx = Mailbox::parse(input))
      return mbx->as_string();
    return {};
  }
  if (FLAGS_rule == "literal") {
    return check_literal(input);
  }
  if (FLAGS_rule == "params") {
    if (auto const params = esmtp_params_parse(input))
      return fmt::format("{} parameter(s):{}", params->size(), join(*params));
    return {};
  }
  if (FLAGS_rule == "mail") {
    if (auto const cmd = MailFrom::parse(input))
      return fmt::format("MAIL FROM:{}{}", cmd->reverse_path.as_string(),
                         join(cmd->parameters));
    return {};
  }
  if (FLAGS_rule == "rcpt") {
    if (auto const cmd = RcptTo::parse(input))
      return fmt::format("RCPT TO:{}{}", cmd->forward_path.as_string(),
                         join(cmd->parameters));
    return {};
  }
  if (FLAGS_rule == "path") {
    if (auto const path = Path::parse(input))
      return path->as_string();
    return {};
  }
  if (FLAGS_rule == "reverse-path") {
    if (auto const path = ReversePath::parse(input))
      return path->as_string();
    return {};
  }
  LOG(FATAL) << "unknown --rule=" << FLAGS_rule;
  return {};
}

bool check_line(std::string_view line)
{
  if (FLAGS_strip_crlf) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.remove_suffix(1);
  }

  if (auto const canonical = check(line)) {
    std::cout << *canonical << '\n';
    return true;
  }

  LOG(WARNING) << "no match for «" << line << "» as " << FLAGS_rule;
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto ok = true;

  if (argc > 1) {
    for (auto arg = 1; arg < argc; ++arg) {
      if (!check_line(argv[arg]))
        ok = false;
    }
  }
  else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!check_line(line))
        ok = false;
    }
  }

  return ok ? 0 : 1;
}
