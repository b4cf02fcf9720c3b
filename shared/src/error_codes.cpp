#include "uplink/error_codes.hpp"

#include <array>

namespace uplink
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
            {ErrorCode::InvalidPath, "invalid_path"},
            {ErrorCode::NotAFile, "not_a_file"},
            {ErrorCode::Unreadable, "unreadable"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::AuthExpired, "auth_expired"},
            {ErrorCode::ServerRejected, "server_rejected"},
            {ErrorCode::NetworkError, "network_error"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::RemoteRejected, "remote_rejected"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        constexpr int kPayloadTooLarge = 413;

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

    bool is_retryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::NetworkError || code == ErrorCode::Timeout;
    }

    bool UploadError::is_oversize() const noexcept
    {
        if (code == ErrorCode::FileTooLarge)
        {
            return true;
        }
        return code == ErrorCode::RemoteRejected && http_status && *http_status == kPayloadTooLarge;
    }

    std::string user_message(const UploadError &error)
    {
        if (error.is_oversize())
        {
            return "File is too large for the upload service.";
        }
        switch (error.code)
        {
        case ErrorCode::Ok:
            return "OK";
        case ErrorCode::InvalidPath:
            return "Invalid file path: " + error.message;
        case ErrorCode::NotAFile:
            return "Path must point to a file, not a directory.";
        case ErrorCode::Unreadable:
            return "Could not read file: " + error.message;
        case ErrorCode::AuthExpired:
            return "Your session has expired. Please check your API key and log in again.";
        case ErrorCode::NetworkError:
            return "Network error occurred. Please check your connection and try again.";
        case ErrorCode::Timeout:
            return "The upload timed out. Please try again.";
        case ErrorCode::RemoteRejected:
            return "Storage rejected the upload (HTTP " +
                   (error.http_status ? std::to_string(*error.http_status) : std::string("?")) + ").";
        case ErrorCode::Cancelled:
            return "Upload cancelled.";
        case ErrorCode::ServerRejected:
        case ErrorCode::FileTooLarge:
        case ErrorCode::InternalError:
            break;
        }
        return error.message.empty() ? std::string("Upload failed. Please try again.") : error.message;
    }

    UploadFailure::UploadFailure(ErrorCode code, const std::string &message, std::optional<int> http_status)
        : std::runtime_error(message),
          error_{.code = code, .message = message, .http_status = http_status}
    {
    }

} // namespace uplink
