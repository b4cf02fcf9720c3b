/**
 * Uplink - Error codes shared by every stage of the upload pipeline.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace uplink
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPath = 1,
        NotAFile = 2,
        Unreadable = 3,
        FileTooLarge = 4,
        AuthExpired = 5,
        ServerRejected = 6,
        NetworkError = 7,
        Timeout = 8,
        RemoteRejected = 9,
        Cancelled = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // NetworkError and Timeout only: a whole run may be repeated with a fresh negotiation.
    bool is_retryable(ErrorCode code) noexcept;

    struct UploadError
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};
        std::optional<int> http_status{};

        bool is_oversize() const noexcept;
    };

    std::string user_message(const UploadError &error);

    class UploadFailure : public std::runtime_error
    {
    public:
        UploadFailure(ErrorCode code, const std::string &message, std::optional<int> http_status = std::nullopt);

        const UploadError &error() const noexcept { return error_; }
        ErrorCode code() const noexcept { return error_.code; }

    private:
        UploadError error_;
    };

} // namespace uplink
