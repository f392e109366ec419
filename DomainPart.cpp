#include "DomainPart.hpp"

#include "RFC5321.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

std::optional<DomainPart> DomainPart::parse(std::string_view dom)
{
  RFC5321::Ctx ctx;
  if (!RFC5321::parse_all<RFC5321::domain_part_only>(dom, "domain_part", ctx))
    return {};
  CHECK(ctx.domain);
  return ctx.domain;
}

std::vector<std::string> DomainPart::labels() const
{
  auto labels{std::vector<std::string>{}};
  if (auto const dom = std::get_if<Domain>(&value_)) {
    boost::algorithm::split(labels, dom->name,
                            boost::algorithm::is_any_of("."));
  }
  return labels;
}

std::string DomainPart::as_string() const
{
  if (auto const dom = std::get_if<Domain>(&value_))
    return dom->name;
  return std::get<AddressLiteral>(value_).as_string();
}
