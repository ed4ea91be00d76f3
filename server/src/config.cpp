#include "chunkdrive/server/config.hpp"

#include <charconv>
#include <limits>

namespace chunkdrive::server
{

    std::optional<std::uint16_t> parse_port(std::string_view text) noexcept
    {
        unsigned long value = 0;
        const auto *first = text.data();
        const auto *last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (text.empty() || ec != std::errc{} || ptr != last || value == 0 ||
            value > std::numeric_limits<std::uint16_t>::max())
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    }

} // namespace chunkdrive::server
