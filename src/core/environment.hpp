#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rl::core
{
    // Returns nullopt when the variable is unset. An empty value is returned
    // as an empty string.
    [[nodiscard]] std::optional<std::string> read_environment(std::string_view name);

    // `value == nullopt` removes the variable.
    bool write_environment(std::string_view name, const std::optional<std::string>& value) noexcept;

    [[nodiscard]] std::int64_t current_process_id() noexcept;
}
