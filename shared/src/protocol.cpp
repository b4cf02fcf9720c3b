#include "uplink/protocol.hpp"

#include <initializer_list>
#include <stdexcept>

namespace uplink::protocol
{

    namespace
    {

        std::string first_string(const nlohmann::json &json, std::initializer_list<const char *> keys)
        {
            for (const auto *key : keys)
            {
                if (auto it = json.find(key); it != json.end() && it->is_string())
                {
                    auto value = it->get<std::string>();
                    if (!value.empty())
                    {
                        return value;
                    }
                }
            }
            return {};
        }

        std::optional<std::map<std::string, std::string>> parse_thumbnails(const nlohmann::json &json)
        {
            std::map<std::string, std::string> thumbnails;
            if (auto it = json.find("thumbnails"); it != json.end() && it->is_object())
            {
                for (const auto &[size, entry] : it->items())
                {
                    if (entry.is_string())
                    {
                        thumbnails.emplace(size, entry.get<std::string>());
                    }
                    else if (entry.is_object() && entry.contains("url") && entry.at("url").is_string())
                    {
                        thumbnails.emplace(size, entry.at("url").get<std::string>());
                    }
                }
            }
            if (thumbnails.empty())
            {
                const auto single = first_string(json, {"thumbnailUrl"});
                if (!single.empty())
                {
                    thumbnails.emplace("default", single);
                }
            }
            if (thumbnails.empty())
            {
                return std::nullopt;
            }
            return thumbnails;
        }

    } // namespace

    void to_json(nlohmann::json &json, const ApiEnvelope &envelope)
    {
        json = {
            {"success", envelope.success},
            {"data", envelope.data},
        };
        if (envelope.error)
        {
            json["error"] = *envelope.error;
        }
    }

    void from_json(const nlohmann::json &json, ApiEnvelope &envelope)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("API response is not a JSON object");
        }
        const auto success = json.find("success");
        envelope.success = success != json.end() && success->is_boolean() && success->get<bool>();
        envelope.data = json.value("data", nlohmann::json{});
        const auto message = first_string(json, {"error", "message"});
        if (!message.empty())
        {
            envelope.error = message;
        }
        else
        {
            envelope.error.reset();
        }
    }

    void to_json(nlohmann::json &json, const PresignedUrlRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"contentType", request.content_type},
            {"fileSize", request.file_size},
            {"preserveFilename", request.preserve_filename},
            {"optimize", request.optimize},
            {"generateThumbnails", request.generate_thumbnails},
        };
    }

    void from_json(const nlohmann::json &json, PresignedUrlRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.content_type = json.at("contentType").get<std::string>();
        request.file_size = json.at("fileSize").get<std::uint64_t>();
        request.preserve_filename = json.value("preserveFilename", false);
        request.optimize = json.value("optimize", false);
        request.generate_thumbnails = json.value("generateThumbnails", false);
    }

    void to_json(nlohmann::json &json, const PresignedUrlData &data)
    {
        json = {
            {"presignedUrl", data.upload_url},
            {"fileKey", data.file_key},
        };
    }

    void from_json(const nlohmann::json &json, PresignedUrlData &data)
    {
        if (!json.is_object())
        {
            data = PresignedUrlData{};
            return;
        }
        data.upload_url = first_string(json, {"presignedUrl", "uploadUrl"});
        data.file_key = first_string(json, {"fileKey"});
    }

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request)
    {
        json = {
            {"generateThumbnails", request.generate_thumbnails},
            {"isPublic", request.is_public},
            {"customName", nullptr},
        };
        if (request.custom_name)
        {
            json["customName"] = *request.custom_name;
        }
    }

    void from_json(const nlohmann::json &json, CompleteUploadRequest &request)
    {
        request.generate_thumbnails = json.value("generateThumbnails", false);
        request.is_public = json.value("isPublic", false);
        if (auto it = json.find("customName"); it != json.end() && it->is_string())
        {
            request.custom_name = it->get<std::string>();
        }
        else
        {
            request.custom_name.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadResult &result)
    {
        json = {
            {"id", result.remote_id},
            {"url", result.url},
            {"fileSize", result.final_size_bytes},
            {"contentType", result.mime_type},
            {"originalFilename", result.original_name},
        };
        if (result.thumbnail_urls)
        {
            json["thumbnails"] = *result.thumbnail_urls;
        }
    }

    void from_json(const nlohmann::json &json, UploadResult &result)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Upload result is not a JSON object");
        }
        result.remote_id = first_string(json, {"id", "key"});
        result.url = first_string(json, {"url"});
        result.final_size_bytes = 0;
        if (auto it = json.find("fileSize"); it != json.end() && it->is_number_unsigned())
        {
            result.final_size_bytes = it->get<std::uint64_t>();
        }
        result.mime_type = first_string(json, {"contentType", "fileType"});
        result.original_name = first_string(json, {"originalFilename", "originalName"});
        result.thumbnail_urls = parse_thumbnails(json);
    }

} // namespace uplink::protocol
