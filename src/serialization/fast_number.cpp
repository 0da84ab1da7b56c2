#include "serialization/fast_number.hpp"

#include <limits>

namespace rl::serialization
{
    namespace
    {
        [[nodiscard]] constexpr NumberError make_error(const NumberErrorCode code) noexcept
        {
            return NumberError{ .code = code };
        }
    }

    std::expected<std::uint32_t, NumberError> parse_u32(const std::string_view text) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        size_t index = 0;
        if (text[index] == '+')
        {
            ++index;
        }
        if (index >= text.size())
        {
            return std::unexpected(make_error(NumberErrorCode::invalid_character));
        }

        std::uint64_t accumulator = 0;
        for (; index < text.size(); ++index)
        {
            const char ch = text[index];
            if (ch < '0' || ch > '9')
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }

            const std::uint32_t digit = static_cast<std::uint32_t>(ch - '0');
            accumulator = accumulator * 10 + digit;
            if (accumulator > std::numeric_limits<std::uint32_t>::max())
            {
                return std::unexpected(make_error(NumberErrorCode::overflow));
            }
        }

        return static_cast<std::uint32_t>(accumulator);
    }
}
