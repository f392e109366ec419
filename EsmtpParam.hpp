#ifndef ESMTP_PARAM_DOT_HPP
#define ESMTP_PARAM_DOT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// One esmtp-keyword ["=" esmtp-value] from a MAIL or RCPT command.
// Keywords are kept exactly as sent; no case folding.

struct EsmtpParam {
  std::string                name;
  std::optional<std::string> value;

  std::string as_string() const;

  bool operator==(EsmtpParam const& rhs) const = default;
};

// Parameters in the order they were sent, duplicates and all.
using EsmtpParams = std::vector<EsmtpParam>;

inline std::ostream& operator<<(std::ostream& os, EsmtpParam const& param)
{
  return os << param.as_string();
}

// Whitespace separated parameter list; must use all the input.  Empty
// input is an empty list.
std::optional<EsmtpParams> esmtp_params_parse(std::string_view input);

#endif // ESMTP_PARAM_DOT_HPP
