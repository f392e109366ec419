#ifndef DOMAIN_PART_DOT_HPP
#define DOMAIN_PART_DOT_HPP

#include "AddressLiteral.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// The 'domain' part of an email address: DNS domain, or address literal.

class DomainPart {
public:
  // Dot separated LDH labels, as written.
  struct Domain {
    std::string name;

    bool operator==(Domain const& rhs) const = default;
  };

  using value_type = std::variant<Domain, AddressLiteral>;

  inline explicit DomainPart(std::string_view dom);

  explicit DomainPart(Domain dom)
    : value_(std::move(dom))
  {
  }
  explicit DomainPart(AddressLiteral lit)
    : value_(std::move(lit))
  {
  }

  static std::optional<DomainPart> parse(std::string_view dom);

  bool is_address_literal() const
  {
    return std::holds_alternative<AddressLiteral>(value_);
  }

  value_type const& value() const { return value_; }

  // The labels of a DNS domain, empty for an address literal.
  std::vector<std::string> labels() const;

  std::string as_string() const;
  inline operator std::string() const;

  bool operator==(DomainPart const& rhs) const = default;

private:
  value_type value_;
};

DomainPart::DomainPart(std::string_view dom)
  : value_(Domain{})
{
  auto dp = parse(dom);
  if (!dp)
    throw std::invalid_argument("invalid domain syntax");
  value_ = std::move(dp->value_);
}

DomainPart::operator std::string() const { return as_string(); }

inline std::ostream& operator<<(std::ostream& os, DomainPart const& dom)
{
  return os << dom.as_string();
}

#endif // DOMAIN_PART_DOT_HPP
