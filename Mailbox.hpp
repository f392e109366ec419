#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include "DomainPart.hpp"
#include "LocalPart.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

class Mailbox {
public:
  // Parse the input string against the RFC-5321 Mailbox grammar.
  inline explicit Mailbox(std::string_view mailbox);

  Mailbox(LocalPart local_part, DomainPart domain)
    : local_part_(std::move(local_part))
    , domain_(std::move(domain))
  {
  }

  // True iff the whole input is a Mailbox.
  static bool validate(std::string_view mailbox);

  static std::optional<Mailbox> parse(std::string_view mailbox);

  LocalPart const&  local_part() const { return local_part_; }
  DomainPart const& domain() const { return domain_; }

  std::string as_string() const;
  inline operator std::string() const;

  bool operator==(Mailbox const& rhs) const = default;

private:
  LocalPart  local_part_;
  DomainPart domain_;
};

Mailbox::Mailbox(std::string_view mailbox)
  : local_part_(LocalPart::types::dot_string, std::string{})
  , domain_(DomainPart::Domain{})
{
  auto mbx = parse(mailbox);
  if (!mbx)
    throw std::invalid_argument("invalid mailbox syntax");
  *this = std::move(*mbx);
}

Mailbox::operator std::string() const { return as_string(); }

inline std::ostream& operator<<(std::ostream& s, Mailbox const& mb)
{
  return s << mb.as_string();
}

#endif // MAILBOX_DOT_HPP
