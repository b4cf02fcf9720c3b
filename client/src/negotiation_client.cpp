#include "uplink/client/negotiation_client.hpp"

#include <utility>

#include "uplink/client/http_client.hpp"
#include "uplink/error_codes.hpp"
#include "uplink/protocol.hpp"

namespace uplink::client
{

    namespace
    {
        constexpr int kUnauthorized = 401;
        constexpr int kPayloadTooLarge = 413;

        protocol::ApiEnvelope parse_envelope(const HttpResponse &response, const char *operation)
        {
            try
            {
                return nlohmann::json::parse(response.body).get<protocol::ApiEnvelope>();
            }
            catch (const std::exception &ex)
            {
                throw UploadFailure(ErrorCode::ServerRejected,
                                    std::string(operation) + ": malformed response (" + ex.what() + ")",
                                    static_cast<int>(response.status));
            }
        }
    } // namespace

    HttpNegotiationClient::HttpNegotiationClient(ApiEndpoint endpoint, Logger logger)
        : endpoint_(std::move(endpoint)),
          logger_(std::move(logger)) {}

    nlohmann::json HttpNegotiationClient::post_json(const std::string &path, const nlohmann::json &body,
                                                    const char *operation) const
    {
        const auto target = join_url(endpoint_.base_url, path);
        if (!is_http_url(target))
        {
            throw UploadFailure(ErrorCode::InternalError, "invalid API URL: " + target);
        }

        const HttpRequest request{
            .method = "POST",
            .url = target,
            .headers = {
                "Authorization: Bearer " + endpoint_.api_key,
                "Content-Type: application/json",
                "Accept: application/json",
                "Expect:",
            },
            .body = body.dump(),
            .timeout = endpoint_.timeout,
        };

        HttpResponse response;
        try
        {
            response = perform_request(request);
        }
        catch (const TransportError &ex)
        {
            logger_.log("error", operation, ": ", ex.what());
            throw UploadFailure(ex.timed_out() ? ErrorCode::Timeout : ErrorCode::NetworkError,
                                std::string(operation) + ": " + ex.what());
        }

        const auto status = static_cast<int>(response.status);
        logger_.log("api", operation, " -> HTTP ", status);
        if (status == kUnauthorized)
        {
            throw UploadFailure(ErrorCode::AuthExpired, "credential rejected by server", status);
        }
        if (status == kPayloadTooLarge)
        {
            throw UploadFailure(ErrorCode::FileTooLarge, "server refused the file size", status);
        }

        if (!is_success(status))
        {
            std::string reason = "HTTP " + std::to_string(status);
            try
            {
                const auto envelope = nlohmann::json::parse(response.body).get<protocol::ApiEnvelope>();
                if (envelope.error)
                {
                    reason = *envelope.error;
                }
            }
            catch (const std::exception &)
            {
                // not JSON, keep the status line
            }
            throw UploadFailure(ErrorCode::ServerRejected, std::string(operation) + ": " + reason, status);
        }

        const auto envelope = parse_envelope(response, operation);
        if (!envelope.success)
        {
            throw UploadFailure(ErrorCode::ServerRejected,
                                envelope.error.value_or(std::string(operation) + " was refused"), status);
        }
        return envelope.data;
    }

    NegotiatedDestination HttpNegotiationClient::begin_upload(const FileDescriptor &descriptor,
                                                              const UploadOptions &options)
    {
        const protocol::PresignedUrlRequest request{
            .filename = descriptor.display_name,
            .content_type = descriptor.mime_type,
            .file_size = descriptor.size_bytes,
            .preserve_filename = options.preserve_original_name,
            .optimize = options.optimize,
            .generate_thumbnails = options.generate_thumbnails,
        };
        const auto data = post_json("/files/presigned-url", request, "presigned-url");
        if (data.is_null())
        {
            throw UploadFailure(ErrorCode::ServerRejected, "invalid response from server: missing data");
        }

        const auto presigned = data.get<protocol::PresignedUrlData>();
        if (presigned.upload_url.empty() || presigned.file_key.empty())
        {
            throw UploadFailure(ErrorCode::ServerRejected,
                                "invalid response from server: missing upload URL or file key");
        }
        logger_.log("api", "negotiated key ", presigned.file_key, " for ", descriptor.display_name);
        return NegotiatedDestination{
            .write_url = presigned.upload_url,
            .opaque_key = presigned.file_key,
        };
    }

    UploadResult HttpNegotiationClient::complete_upload(const std::string &opaque_key, const UploadOptions &options)
    {
        protocol::CompleteUploadRequest request{
            .generate_thumbnails = options.generate_thumbnails,
            .is_public = options.is_public,
            .custom_name = std::nullopt,
        };
        if (!options.custom_display_name.empty())
        {
            request.custom_name = options.custom_display_name;
        }

        const auto path = "/files/complete-upload/" + escape_path_segment(opaque_key);
        const auto data = post_json(path, request, "complete-upload");

        UploadResult result;
        try
        {
            result = data.get<protocol::UploadResult>();
        }
        catch (const std::exception &ex)
        {
            throw UploadFailure(ErrorCode::ServerRejected, std::string("invalid upload result: ") + ex.what());
        }
        if (result.url.empty())
        {
            throw UploadFailure(ErrorCode::ServerRejected, "invalid response from server: missing file URL");
        }
        if (result.remote_id.empty())
        {
            result.remote_id = opaque_key;
        }
        return result;
    }

} // namespace uplink::client
