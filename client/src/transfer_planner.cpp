#include "uplink/client/transfer_planner.hpp"

#include <algorithm>
#include <array>

namespace uplink::client
{

    namespace
    {

        constexpr std::uint64_t kMiB = 1024 * 1024;

        struct ProfileMapping
        {
            ProfileKind kind;
            std::string_view label;
            std::uint64_t part_size_bytes;
            std::size_t max_concurrent_uploads;
            std::chrono::milliseconds timeout;
        };

        constexpr std::array<ProfileMapping, 4> kProfiles{{
            {ProfileKind::Slow, "slow", 5 * kMiB, 1, std::chrono::minutes(60)},
            {ProfileKind::Medium, "medium", 10 * kMiB, 2, std::chrono::minutes(30)},
            {ProfileKind::Fast, "fast", 25 * kMiB, 4, std::chrono::minutes(15)},
            {ProfileKind::Ultra, "ultra", 50 * kMiB, 8, std::chrono::minutes(10)},
        }};

    } // namespace

    std::string_view to_string(ProfileKind kind) noexcept
    {
        for (const auto &mapping : kProfiles)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ProfileKind> profile_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kProfiles)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    TransferProfile profile_for(ProfileKind kind) noexcept
    {
        for (const auto &mapping : kProfiles)
        {
            if (mapping.kind == kind)
            {
                return TransferProfile{
                    .kind = mapping.kind,
                    .part_size_bytes = mapping.part_size_bytes,
                    .max_concurrent_uploads = mapping.max_concurrent_uploads,
                    .timeout = mapping.timeout,
                };
            }
        }
        return profile_for(ProfileKind::Medium);
    }

    std::string_view to_string(TransferStrategy strategy) noexcept
    {
        return strategy == TransferStrategy::Streamed ? "streamed" : "buffered";
    }

    TransferStrategy plan_transfer(const FileDescriptor &descriptor, const TransferProfile &) noexcept
    {
        return descriptor.size_bytes > kStreamingThreshold ? TransferStrategy::Streamed : TransferStrategy::Buffered;
    }

    std::size_t stream_chunk_size(const TransferProfile &profile) noexcept
    {
        const auto candidate = static_cast<std::size_t>(profile.part_size_bytes / 16);
        return std::clamp(candidate, kMinStreamChunk, kMaxStreamChunk);
    }

} // namespace uplink::client
