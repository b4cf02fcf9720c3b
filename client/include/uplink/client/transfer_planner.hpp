#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "uplink/client/types.hpp"

namespace uplink::client
{

    enum class ProfileKind : std::uint8_t
    {
        Slow,
        Medium,
        Fast,
        Ultra
    };

    std::string_view to_string(ProfileKind kind) noexcept;
    std::optional<ProfileKind> profile_kind_from_string(std::string_view value) noexcept;

    struct TransferProfile
    {
        ProfileKind kind{ProfileKind::Medium};
        std::uint64_t part_size_bytes{};
        std::size_t max_concurrent_uploads{};
        std::chrono::milliseconds timeout{};
    };

    TransferProfile profile_for(ProfileKind kind) noexcept;

    enum class TransferStrategy : std::uint8_t
    {
        Buffered,
        Streamed
    };

    std::string_view to_string(TransferStrategy strategy) noexcept;

    // Files strictly larger than this are streamed.
    inline constexpr std::uint64_t kStreamingThreshold = 100ULL * 1024 * 1024;

    inline constexpr std::size_t kMinStreamChunk = 64 * 1024;
    inline constexpr std::size_t kMaxStreamChunk = 1024 * 1024;

    TransferStrategy plan_transfer(const FileDescriptor &descriptor, const TransferProfile &profile) noexcept;

    std::size_t stream_chunk_size(const TransferProfile &profile) noexcept;

} // namespace uplink::client
