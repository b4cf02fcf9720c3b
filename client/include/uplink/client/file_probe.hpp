#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "uplink/client/types.hpp"

namespace uplink::client
{

    inline constexpr std::uint64_t kMaxFileSize = 50ULL * 1024 * 1024 * 1024;
    inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

    /**
     * Inspects a local file before anything is sent.
     *
     * Throws UploadFailure with InvalidPath (unsafe or missing path), NotAFile,
     * Unreadable or FileTooLarge (above max_size).
     */
    FileDescriptor probe_file(const std::string &path, std::uint64_t max_size = kMaxFileSize);

    // Rejects traversal sequences, null bytes, home shortcuts and doubled separators.
    bool is_safe_path(std::string_view path) noexcept;

    std::string mime_type_for(const std::filesystem::path &path);

    bool is_supported_mime_type(std::string_view mime_type) noexcept;

} // namespace uplink::client
