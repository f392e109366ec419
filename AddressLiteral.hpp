#ifndef ADDRESS_LITERAL_DOT_HPP
#define ADDRESS_LITERAL_DOT_HPP

#include "IP.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// RFC-5321 section 4.1.3. Address Literals

class AddressLiteral {
public:
  // General-address-literal: Standardized-tag ":" 1*dcontent
  struct Tagged {
    std::string tag;
    std::string value;

    bool operator==(Tagged const& rhs) const = default;
  };

  // Bracketed text that matched none of the formal forms.
  struct FreeForm {
    std::string text;

    bool operator==(FreeForm const& rhs) const = default;
  };

  using value_type = std::variant<IP::Address, Tagged, FreeForm>;

  // Parse "[...]", including the brackets; anything between them that is
  // not IPv4, IPv6 or a tagged literal is kept as FreeForm.
  inline explicit AddressLiteral(std::string_view text);

  explicit AddressLiteral(IP::Address addr)
    : value_(addr)
  {
  }
  explicit AddressLiteral(Tagged tagged)
    : value_(std::move(tagged))
  {
  }
  explicit AddressLiteral(FreeForm free_form)
    : value_(std::move(free_form))
  {
  }

  static std::optional<AddressLiteral> parse(std::string_view text);

  // Try the formal forms against the text of a FreeForm literal.  Returns
  // empty if this is not a FreeForm, or its text is no formal literal.
  std::optional<AddressLiteral> upgrade() const;

  bool is_ip() const { return std::holds_alternative<IP::Address>(value_); }
  bool is_tagged() const { return std::holds_alternative<Tagged>(value_); }
  bool is_free_form() const { return std::holds_alternative<FreeForm>(value_); }

  value_type const& value() const { return value_; }

  std::string as_string() const;
  inline operator std::string() const;

  bool operator==(AddressLiteral const& rhs) const = default;

private:
  value_type value_;
};

AddressLiteral::AddressLiteral(std::string_view text)
  : value_(FreeForm{})
{
  auto lit = parse(text);
  if (!lit)
    throw std::invalid_argument("invalid address literal syntax");
  value_ = std::move(lit->value_);
}

AddressLiteral::operator std::string() const { return as_string(); }

inline std::ostream& operator<<(std::ostream& os, AddressLiteral const& lit)
{
  return os << lit.as_string();
}

#endif // ADDRESS_LITERAL_DOT_HPP
