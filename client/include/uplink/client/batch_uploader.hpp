#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "uplink/client/orchestrator.hpp"

namespace uplink::client
{

    /**
     * Uploads several files with independent orchestrators, never running more
     * than profile.max_concurrent_uploads at once. The negotiation client and
     * transfer engine are shared between workers and must tolerate concurrent
     * calls.
     */
    class BatchUploader
    {
    public:
        using ProgressFactory = std::function<ProgressObserver(std::size_t index, const std::string &path)>;

        BatchUploader(TransferProfile profile, UploadOptions options, NegotiationClient &negotiation,
                      TransferEngine &engine, Logger logger);

        // Outcomes are returned in the order of paths.
        std::vector<UploadOutcome> upload_all(const std::vector<std::string> &paths,
                                              const ProgressFactory &progress = {},
                                              const CancellationToken *cancel = nullptr);

        std::size_t peak_concurrency() const noexcept { return peak_active_.load(); }

    private:
        void worker(const std::vector<std::string> &paths, std::vector<UploadOutcome> &outcomes,
                    const ProgressFactory &progress, const CancellationToken *cancel);

        TransferProfile profile_;
        UploadOptions options_;
        NegotiationClient &negotiation_;
        TransferEngine &engine_;
        Logger logger_;

        std::atomic<std::size_t> next_index_{0};
        std::atomic<std::size_t> active_{0};
        std::atomic<std::size_t> peak_active_{0};
    };

} // namespace uplink::client
