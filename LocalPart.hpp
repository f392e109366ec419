#ifndef LOCAL_PART_DOT_HPP
#define LOCAL_PART_DOT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// The Local-part of a Mailbox: a Dot-string, or a Quoted-string.  The
// text of a Quoted-string is kept with the quotes and quoted-pair
// backslashes removed.

class LocalPart {
public:
  enum class types : uint8_t {
    dot_string,
    quoted_string,
  };

  inline explicit LocalPart(std::string_view local_part);

  // Accept the text as already validated via some external check.
  LocalPart(types type, std::string text)
    : type_(type)
    , text_(std::move(text))
  {
  }

  static std::optional<LocalPart> parse(std::string_view local_part);

  types              type() const { return type_; }
  std::string const& text() const { return text_; }

  bool is_quoted() const { return type_ == types::quoted_string; }

  // Dot-string as is, Quoted-string with only '"' and '\' escaped.
  std::string as_string() const;
  inline operator std::string() const;

  bool operator==(LocalPart const& rhs) const = default;

private:
  types       type_;
  std::string text_;
};

LocalPart::LocalPart(std::string_view local_part)
  : type_(types::dot_string)
{
  auto lp = parse(local_part);
  if (!lp)
    throw std::invalid_argument("invalid local part syntax");
  *this = std::move(*lp);
}

LocalPart::operator std::string() const { return as_string(); }

inline std::ostream& operator<<(std::ostream& os, LocalPart const& lp)
{
  return os << lp.as_string();
}

#endif // LOCAL_PART_DOT_HPP
