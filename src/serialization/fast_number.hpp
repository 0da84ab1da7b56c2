#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace rl::serialization
{
    enum class NumberErrorCode
    {
        empty_input,
        invalid_character,
        overflow,
    };

    struct NumberError final
    {
        NumberErrorCode code{ NumberErrorCode::invalid_character };
    };

    // Decimal only. An optional leading '+' is accepted; whitespace is not.
    [[nodiscard]] std::expected<std::uint32_t, NumberError> parse_u32(std::string_view text) noexcept;
}
