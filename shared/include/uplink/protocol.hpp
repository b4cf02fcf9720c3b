/**
 * Uplink - JSON schema of the upload negotiation API.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace uplink::protocol
{

    // {success, data, error?} wrapper used by every API response.
    struct ApiEnvelope
    {
        bool success{};
        nlohmann::json data{};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const ApiEnvelope &envelope);
    void from_json(const nlohmann::json &json, ApiEnvelope &envelope);

    struct PresignedUrlRequest
    {
        std::string filename;
        std::string content_type;
        std::uint64_t file_size{};
        bool preserve_filename{};
        bool optimize{};
        bool generate_thumbnails{};
    };

    void to_json(nlohmann::json &json, const PresignedUrlRequest &request);
    void from_json(const nlohmann::json &json, PresignedUrlRequest &request);

    // Either field may be empty when the server omitted it.
    struct PresignedUrlData
    {
        std::string upload_url;
        std::string file_key;
    };

    void to_json(nlohmann::json &json, const PresignedUrlData &data);
    void from_json(const nlohmann::json &json, PresignedUrlData &data);

    struct CompleteUploadRequest
    {
        bool generate_thumbnails{};
        bool is_public{};
        std::optional<std::string> custom_name{};
    };

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request);
    void from_json(const nlohmann::json &json, CompleteUploadRequest &request);

    struct UploadResult
    {
        std::string remote_id;
        std::string url;
        std::uint64_t final_size_bytes{};
        std::string mime_type;
        std::string original_name;
        std::optional<std::map<std::string, std::string>> thumbnail_urls{};
    };

    void to_json(nlohmann::json &json, const UploadResult &result);
    void from_json(const nlohmann::json &json, UploadResult &result);

} // namespace uplink::protocol
