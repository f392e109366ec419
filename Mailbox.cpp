#include "Mailbox.hpp"

#include "RFC5321.hpp"

#include <fmt/format.h>

bool Mailbox::validate(std::string_view mailbox)
{
  RFC5321::Ctx ctx;
  return RFC5321::parse_all<RFC5321::mailbox_only>(mailbox, "mailbox", ctx);
}

std::optional<Mailbox> Mailbox::parse(std::string_view mailbox)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::mailbox_only>(mailbox, "mailbox", ctx))
    return {};
  CHECK(ctx.mbx);
  return ctx.mbx;
}

std::string Mailbox::as_string() const
{
  return fmt::format("{}@{}", local_part_.as_string(), domain_.as_string());
}
