#ifndef IP6_DOT_HPP
#define IP6_DOT_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace IP6 {
using namespace std::literals::string_view_literals;

using octets = std::array<uint8_t, 16>;

auto is_address(std::string_view addr) -> bool;
auto to_address_literal(std::string_view addr) -> std::string;
auto to_octets(std::string_view addr) -> std::optional<octets>;

auto constexpr lit_pfx{"[IPv6:"sv};
auto constexpr lit_pfx_sz{std::size(lit_pfx)};

auto constexpr lit_sfx{"]"sv};

// The "IPv6:" tag, without the opening bracket.
auto constexpr tag_sz{lit_pfx_sz - 1};

} // namespace IP6

#endif // IP6_DOT_HPP
