#include "AddressLiteral.hpp"

#include "RFC5321.hpp"

#include <fmt/format.h>

std::optional<AddressLiteral> AddressLiteral::parse(std::string_view text)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::address_literal_only>(
          text, "address_literal", ctx))
    return {};
  CHECK(ctx.literal);
  return ctx.literal;
}

std::optional<AddressLiteral> AddressLiteral::upgrade() const
{
  auto const free_form = std::get_if<FreeForm>(&value_);
  if (!free_form)
    return {};

  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::address_literal_upgrade>(
          free_form->text, "address_literal_upgrade", ctx))
    return {};
  CHECK(ctx.literal);
  return ctx.literal;
}

std::string AddressLiteral::as_string() const
{
  if (auto const addr = std::get_if<IP::Address>(&value_))
    return addr->to_address_literal();
  if (auto const tagged = std::get_if<Tagged>(&value_))
    return fmt::format("[{}:{}]", tagged->tag, tagged->value);
  return fmt::format("[{}]", std::get<FreeForm>(value_).text);
}
