#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace reqbind::charset {

// 256-entry byte classification table.
struct alignas(64) table {
    std::array<bool, 256> bits{};

    [[nodiscard]] constexpr bool has(char c) const noexcept {
        return bits[static_cast<unsigned char>(c)];
    }
    [[nodiscard]] constexpr bool has(unsigned char c) const noexcept { return bits[c]; }
};

constexpr table with(table base, std::string_view chars) noexcept {
    for (char c : chars) {
        base.bits[static_cast<unsigned char>(c)] = true;
    }
    return base;
}

constexpr table make(std::string_view chars) noexcept {
    return with(table{}, chars);
}

inline constexpr table digits = make("0123456789");
inline constexpr table whitespace = make("\r\n\t\v ");
inline constexpr table delims = with(whitespace, "{}[]\",");
inline constexpr table exponents = make("Ee");
inline constexpr table signs = make("+-");

static_assert(digits.has('7') && !digits.has('a'));
static_assert(delims.has(' ') && delims.has(',') && !delims.has(':'));

} // namespace reqbind::charset
