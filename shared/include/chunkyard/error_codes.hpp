/**
 * Chunkyard - Error codes shared by every service layer and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkyard
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        ValidationError = 2,
        NotFound = 3,
        MissingChunks = 4,
        ChecksumMismatch = 5,
        InvalidRange = 6,
        ProviderError = 7,
        UnsupportedProvider = 8,
        UnsupportedKind = 9,
        Conflict = 10,
        InternalError = 11
    };

    // Stable lowercase tag, e.g. "missing_chunks".
    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

} // namespace chunkyard
