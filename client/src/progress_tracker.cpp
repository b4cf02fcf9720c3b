#include "uplink/client/progress_tracker.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace uplink::client
{

    ProgressTracker::ProgressTracker(std::chrono::steady_clock::time_point start)
        : start_(start) {}

    ProgressSnapshot ProgressTracker::on_sample(const TransferProgressSample &sample) const
    {
        ProgressSnapshot snapshot;
        snapshot.bytes_sent = sample.bytes_sent;
        snapshot.total_bytes = sample.total_bytes;

        if (sample.total_bytes == 0 || sample.bytes_sent >= sample.total_bytes)
        {
            snapshot.percent = 100.0;
        }
        else
        {
            const auto ratio = static_cast<double>(sample.bytes_sent) / static_cast<double>(sample.total_bytes);
            snapshot.percent = std::clamp(ratio * 100.0, 0.0, 100.0);
        }

        if (sample.elapsed_millis > 0)
        {
            snapshot.bytes_per_second = static_cast<double>(sample.bytes_sent) /
                                        (static_cast<double>(sample.elapsed_millis) / 1000.0);
        }

        if (snapshot.bytes_per_second <= 0.0)
        {
            snapshot.eta_label = std::string(kEtaCalculating);
        }
        else
        {
            const auto remaining = sample.total_bytes > sample.bytes_sent ? sample.total_bytes - sample.bytes_sent : 0;
            snapshot.eta_label = format_eta(static_cast<double>(remaining) / snapshot.bytes_per_second);
        }
        return snapshot;
    }

    TransferProgressSample ProgressTracker::sample_at(std::uint64_t bytes_sent, std::uint64_t total_bytes,
                                                      std::chrono::steady_clock::time_point now) const
    {
        const auto elapsed = now > start_ ? std::chrono::duration_cast<std::chrono::milliseconds>(now - start_)
                                          : std::chrono::milliseconds::zero();
        return TransferProgressSample{
            .bytes_sent = bytes_sent,
            .total_bytes = total_bytes,
            .elapsed_millis = static_cast<std::uint64_t>(elapsed.count()),
        };
    }

    std::string format_eta(double remaining_seconds)
    {
        if (!std::isfinite(remaining_seconds))
        {
            return std::string(kEtaCalculating);
        }
        const auto seconds = static_cast<std::uint64_t>(std::ceil(std::max(remaining_seconds, 0.0)));
        if (seconds < 60)
        {
            return std::to_string(seconds) + "s";
        }
        if (seconds < 3600)
        {
            return std::to_string(seconds / 60) + "m";
        }
        return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
    }

    std::string format_bytes(std::uint64_t bytes)
    {
        if (bytes == 0)
        {
            return "0 Bytes";
        }
        static constexpr std::array<const char *, 5> kUnits{"Bytes", "KB", "MB", "GB", "TB"};
        auto value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }

        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << value;
        auto text = out.str();
        // Match toFixed(2) followed by parseFloat: drop trailing zeros and a bare point.
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.')
        {
            text.pop_back();
        }
        return text + " " + kUnits[unit];
    }

    std::string render_progress_line(const ProgressSnapshot &snapshot, std::size_t bar_width)
    {
        const auto filled = std::min(bar_width, static_cast<std::size_t>(
                                                    std::lround(snapshot.percent / 100.0 * static_cast<double>(bar_width))));
        std::string bar;
        for (std::size_t i = 0; i < bar_width; ++i)
        {
            bar += i < filled ? "█" : "░";
        }

        std::ostringstream out;
        out << bar << ' ' << static_cast<int>(std::floor(snapshot.percent)) << "% ("
            << format_bytes(snapshot.bytes_sent) << " / " << format_bytes(snapshot.total_bytes) << ") "
            << format_bytes(static_cast<std::uint64_t>(snapshot.bytes_per_second)) << "/s ETA " << snapshot.eta_label;
        return out.str();
    }

} // namespace uplink::client
