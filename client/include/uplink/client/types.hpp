#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "uplink/protocol.hpp"

namespace uplink::client
{

    struct FileDescriptor
    {
        std::filesystem::path absolute_path;
        std::string display_name;
        std::uint64_t size_bytes{};
        std::string mime_type;
        std::filesystem::file_time_type modified_at{};
    };

    struct UploadOptions
    {
        bool preserve_original_name{true};
        bool optimize{true};
        bool generate_thumbnails{true};
        std::string custom_display_name{};
        bool is_public{true};
    };

    // Valid for one transfer attempt; finalize needs only the key.
    struct NegotiatedDestination
    {
        std::string write_url;
        std::string opaque_key;
    };

    struct TransferProgressSample
    {
        std::uint64_t bytes_sent{};
        std::uint64_t total_bytes{};
        std::uint64_t elapsed_millis{};
    };

    using ProgressObserver = std::function<void(const TransferProgressSample &)>;

    struct TransferReceipt
    {
        std::uint64_t bytes_sent{};
        int status_code{};
        std::string content_digest;
    };

    using UploadResult = uplink::protocol::UploadResult;

    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
        bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace uplink::client
