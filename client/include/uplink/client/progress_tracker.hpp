#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "uplink/client/types.hpp"

namespace uplink::client
{

    inline constexpr std::string_view kEtaCalculating = "Calculating...";

    struct ProgressSnapshot
    {
        double percent{};
        double bytes_per_second{};
        std::string eta_label;
        std::uint64_t bytes_sent{};
        std::uint64_t total_bytes{};
    };

    /**
     * Derives percent, speed and ETA from progress samples. The only state is
     * the start timestamp the caller supplies; on_sample() is a pure function
     * of the sample.
     */
    class ProgressTracker
    {
    public:
        explicit ProgressTracker(std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now());

        ProgressSnapshot on_sample(const TransferProgressSample &sample) const;

        TransferProgressSample sample_at(std::uint64_t bytes_sent, std::uint64_t total_bytes,
                                         std::chrono::steady_clock::time_point now) const;

        std::chrono::steady_clock::time_point start() const noexcept { return start_; }

    private:
        std::chrono::steady_clock::time_point start_;
    };

    // "45s", "2m", "1h 5m"; rounds partial seconds up.
    std::string format_eta(double remaining_seconds);

    // 1024-based, at most two decimals: "0 Bytes", "1.5 KB", "10 MB".
    std::string format_bytes(std::uint64_t bytes);

    // "[bar] 42% (4.2 MB / 10 MB) 1.5 MB/s ETA 4s"
    std::string render_progress_line(const ProgressSnapshot &snapshot, std::size_t bar_width = 30);

} // namespace uplink::client
