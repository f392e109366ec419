#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace IP4 {
using octets = std::array<uint8_t, 4>;

auto is_address(std::string_view addr) -> bool;
auto to_address_literal(std::string_view addr) -> std::string;
auto to_octets(std::string_view addr) -> std::optional<octets>;

constexpr char lit_pfx[] = "[";
constexpr char lit_sfx[] = "]";

} // namespace IP4

#endif // IP4_DOT_HPP
