#ifndef COMMAND_DOT_HPP
#define COMMAND_DOT_HPP

#include "EsmtpParam.hpp"
#include "Path.hpp"

#include <optional>
#include <string_view>

// The argument part of the envelope commands.  The whole input must
// match; no line terminator is consumed or required, strip the CRLF
// before calling.

// "MAIL FROM:" Reverse-path [SP Mail-parameters]
struct MailFrom {
  ReversePath reverse_path;
  EsmtpParams parameters;

  static std::optional<MailFrom> parse(std::string_view cmd);
};

// "RCPT TO:" ( "<Postmaster>" / Forward-path ) [SP Rcpt-parameters]
struct RcptTo {
  Path        forward_path;
  EsmtpParams parameters;

  static std::optional<RcptTo> parse(std::string_view cmd);
};

#endif // COMMAND_DOT_HPP
