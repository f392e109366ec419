#include "LocalPart.hpp"

#include "RFC5321.hpp"

std::optional<LocalPart> LocalPart::parse(std::string_view local_part)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::local_part_only>(local_part, "local_part",
                                                     ctx))
    return {};
  CHECK(ctx.local);
  return ctx.local;
}

std::string LocalPart::as_string() const
{
  if (type_ == types::dot_string)
    return text_;

  // Any quoted-pair is valid, but only these two need one.
  std::string ret;
  ret.reserve(text_.size() + 2);
  ret += '"';
  for (auto ch : text_) {
    if (ch == '"' || ch == '\\')
      ret += '\\';
    ret += ch;
  }
  ret += '"';
  return ret;
}
