#include "EsmtpParam.hpp"

#include "RFC5321.hpp"

#include <fmt/format.h>

std::string EsmtpParam::as_string() const
{
  if (value)
    return fmt::format("{}={}", name, *value);
  return name;
}

std::optional<EsmtpParams> esmtp_params_parse(std::string_view input)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::esmtp_params_only>(input, "esmtp_params",
                                                       ctx))
    return {};
  return ctx.parameters;
}
