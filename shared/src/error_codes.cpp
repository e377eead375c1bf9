#include "chunkyard/error_codes.hpp"

#include <array>

namespace chunkyard
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::ValidationError, "validation_error"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::MissingChunks, "missing_chunks"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::InvalidRange, "invalid_range"},
            {ErrorCode::ProviderError, "provider_error"},
            {ErrorCode::UnsupportedProvider, "unsupported_provider"},
            {ErrorCode::UnsupportedKind, "unsupported_kind"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace chunkyard
