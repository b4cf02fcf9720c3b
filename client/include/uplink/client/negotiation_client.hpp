#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "uplink/client/logger.hpp"
#include "uplink/client/types.hpp"

namespace uplink::client
{

    /**
     * Two-phase handshake with the storage backend surrounding the byte
     * transfer. Failures are reported as UploadFailure.
     */
    class NegotiationClient
    {
    public:
        virtual ~NegotiationClient() = default;

        // Phase 1: obtain a write URL and the opaque key identifying the upload.
        virtual NegotiatedDestination begin_upload(const FileDescriptor &descriptor, const UploadOptions &options) = 0;

        // Phase 2: only after the bytes were accepted by storage.
        virtual UploadResult complete_upload(const std::string &opaque_key, const UploadOptions &options) = 0;
    };

    struct ApiEndpoint
    {
        std::string base_url;
        std::string api_key;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    };

    class HttpNegotiationClient : public NegotiationClient
    {
    public:
        HttpNegotiationClient(ApiEndpoint endpoint, Logger logger);

        NegotiatedDestination begin_upload(const FileDescriptor &descriptor, const UploadOptions &options) override;
        UploadResult complete_upload(const std::string &opaque_key, const UploadOptions &options) override;

    private:
        nlohmann::json post_json(const std::string &path, const nlohmann::json &body, const char *operation) const;

        ApiEndpoint endpoint_;
        Logger logger_;
    };

} // namespace uplink::client
