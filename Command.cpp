#include "Command.hpp"

#include "RFC5321.hpp"

std::optional<MailFrom> MailFrom::parse(std::string_view cmd)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::mail_from_only>(cmd, "mail_from", ctx))
    return {};

  if (ctx.null_path)
    return MailFrom{ReversePath{ReversePath::Null{}},
                    std::move(ctx.parameters)};

  CHECK(ctx.mbx);
  return MailFrom{ReversePath{*ctx.mbx}, std::move(ctx.parameters)};
}

std::optional<RcptTo> RcptTo::parse(std::string_view cmd)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::rcpt_to_only>(cmd, "rcpt_to", ctx))
    return {};

  if (ctx.postmaster)
    return RcptTo{Path{Path::PostMaster{}}, std::move(ctx.parameters)};

  CHECK(ctx.mbx);
  return RcptTo{Path{*ctx.mbx}, std::move(ctx.parameters)};
}
