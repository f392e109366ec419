#include "Path.hpp"

#include "RFC5321.hpp"

#include <fmt/format.h>

std::optional<Path> Path::parse(std::string_view path)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::forward_path_only>(path, "forward_path",
                                                       ctx))
    return {};
  if (ctx.postmaster)
    return Path{PostMaster{}};
  CHECK(ctx.mbx);
  return Path{*ctx.mbx};
}

std::string Path::as_string() const
{
  if (is_postmaster())
    return "<postmaster>";
  return fmt::format("<{}>", std::get<Mailbox>(value_).as_string());
}

std::optional<ReversePath> ReversePath::parse(std::string_view path)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::reverse_path_only>(path, "reverse_path",
                                                       ctx))
    return {};
  if (ctx.null_path)
    return ReversePath{Null{}};
  CHECK(ctx.mbx);
  return ReversePath{*ctx.mbx};
}

std::string ReversePath::as_string() const
{
  if (is_null())
    return "<>";
  return fmt::format("<{}>", std::get<Mailbox>(value_).as_string());
}
