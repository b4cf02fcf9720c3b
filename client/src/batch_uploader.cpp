#include "uplink/client/batch_uploader.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace uplink::client
{

    BatchUploader::BatchUploader(TransferProfile profile, UploadOptions options, NegotiationClient &negotiation,
                                 TransferEngine &engine, Logger logger)
        : profile_(std::move(profile)),
          options_(std::move(options)),
          negotiation_(negotiation),
          engine_(engine),
          logger_(std::move(logger)) {}

    std::vector<UploadOutcome> BatchUploader::upload_all(const std::vector<std::string> &paths,
                                                         const ProgressFactory &progress,
                                                         const CancellationToken *cancel)
    {
        std::vector<UploadOutcome> outcomes(paths.size());
        next_index_ = 0;
        active_ = 0;
        peak_active_ = 0;
        if (paths.empty())
        {
            return outcomes;
        }

        const auto limit = std::max<std::size_t>(1, profile_.max_concurrent_uploads);
        const auto worker_count = std::min(limit, paths.size());
        logger_.log("batch", paths.size(), " files, ", worker_count, " concurrent uploads");

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers.emplace_back([&]()
                                 { worker(paths, outcomes, progress, cancel); });
        }
        for (auto &thread : workers)
        {
            thread.join();
        }
        return outcomes;
    }

    void BatchUploader::worker(const std::vector<std::string> &paths, std::vector<UploadOutcome> &outcomes,
                               const ProgressFactory &progress, const CancellationToken *cancel)
    {
        UploadOrchestrator orchestrator(profile_, options_, negotiation_, engine_, logger_);
        for (;;)
        {
            const auto index = next_index_.fetch_add(1);
            if (index >= paths.size())
            {
                return;
            }

            const auto now_active = active_.fetch_add(1) + 1;
            auto peak = peak_active_.load();
            while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active))
            {
            }

            const auto observer = progress ? progress(index, paths[index]) : ProgressObserver{};
            outcomes[index] = orchestrator.run(paths[index], observer, cancel);
            active_.fetch_sub(1);
        }
    }

} // namespace uplink::client
