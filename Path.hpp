#ifndef PATH_DOT_HPP
#define PATH_DOT_HPP

#include "Mailbox.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// Forward-path, the argument of RCPT TO: a Mailbox, or the special
// "<Postmaster>" recipient that needs no domain.

class Path {
public:
  struct PostMaster {
    bool operator==(PostMaster const& rhs) const = default;
  };

  using value_type = std::variant<Mailbox, PostMaster>;

  explicit Path(Mailbox mbx)
    : value_(std::move(mbx))
  {
  }
  explicit Path(PostMaster pm)
    : value_(pm)
  {
  }

  // "<postmaster>" in any case, or "<" [A-d-l ":"] Mailbox ">"
  static std::optional<Path> parse(std::string_view path);

  bool is_postmaster() const
  {
    return std::holds_alternative<PostMaster>(value_);
  }

  value_type const& value() const { return value_; }

  std::string as_string() const;

  bool operator==(Path const& rhs) const = default;

private:
  value_type value_;
};

inline std::ostream& operator<<(std::ostream& os, Path const& path)
{
  return os << path.as_string();
}

// Reverse-path, the argument of MAIL FROM: a Mailbox, or the null
// reverse-path "<>" used for bounces.

class ReversePath {
public:
  struct Null {
    bool operator==(Null const& rhs) const = default;
  };

  using value_type = std::variant<Mailbox, Null>;

  explicit ReversePath(Mailbox mbx)
    : value_(std::move(mbx))
  {
  }
  explicit ReversePath(Null null)
    : value_(null)
  {
  }

  static std::optional<ReversePath> parse(std::string_view path);

  bool is_null() const { return std::holds_alternative<Null>(value_); }

  value_type const& value() const { return value_; }

  std::string as_string() const;

  bool operator==(ReversePath const& rhs) const = default;

private:
  value_type value_;
};

inline std::ostream& operator<<(std::ostream& os, ReversePath const& path)
{
  return os << path.as_string();
}

#endif // PATH_DOT_HPP
