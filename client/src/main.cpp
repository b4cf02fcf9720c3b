#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "uplink/client/batch_uploader.hpp"
#include "uplink/client/config.hpp"
#include "uplink/client/logger.hpp"
#include "uplink/client/negotiation_client.hpp"
#include "uplink/client/orchestrator.hpp"
#include "uplink/client/progress_tracker.hpp"
#include "uplink/client/transfer_engine.hpp"
#include "uplink/error_codes.hpp"
#include "uplink/version.hpp"

namespace
{

    using namespace uplink::client;

    // Turns SIGINT/SIGTERM into a cancellation request for the running uploads.
    class InterruptWatcher
    {
    public:
        explicit InterruptWatcher(CancellationToken &token)
            : signals_(io_context_, SIGINT, SIGTERM)
        {
            signals_.async_wait([&token](const std::error_code &ec, int /*signal*/)
                                {
                if (!ec) {
                    token.cancel();
                } });
            thread_ = std::thread([this]
                                  { io_context_.run(); });
        }

        ~InterruptWatcher()
        {
            io_context_.stop();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        InterruptWatcher(const InterruptWatcher &) = delete;
        InterruptWatcher &operator=(const InterruptWatcher &) = delete;

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
    };

    void print_result(const std::string &path, const UploadOutcome &outcome)
    {
        if (outcome.succeeded() && outcome.result)
        {
            const auto &result = *outcome.result;
            std::cout << "OK: " << path << "\n"
                      << "  URL:  " << result.url << "\n"
                      << "  Size: " << format_bytes(result.final_size_bytes) << "\n"
                      << "  Type: " << result.mime_type << "\n"
                      << "  Key:  " << result.remote_id << "\n";
            if (result.thumbnail_urls)
            {
                for (const auto &[size, url] : *result.thumbnail_urls)
                {
                    std::cout << "  Thumbnail (" << size << "): " << url << "\n";
                }
            }
            std::cout.flush();
            return;
        }

        if (outcome.error)
        {
            std::cerr << "ERROR: " << path << ": " << uplink::to_string(outcome.error->code) << ": "
                      << uplink::user_message(*outcome.error) << std::endl;
        }
        else
        {
            std::cerr << "ERROR: " << path << ": upload did not complete" << std::endl;
        }
    }

    int upload_single(const ClientConfig &config, const TransferProfile &profile, NegotiationClient &negotiation,
                      TransferEngine &engine, const Logger &logger, CancellationToken &cancel)
    {
        UploadOrchestrator orchestrator(profile, config.options, negotiation, engine, logger);
        const ProgressTracker tracker;
        const auto on_progress = [&tracker](const TransferProgressSample &sample)
        {
            std::cerr << "\r" << render_progress_line(tracker.on_sample(sample)) << std::flush;
        };

        const auto outcome = orchestrator.run(config.files.front(), on_progress, &cancel);
        std::cerr << std::endl;
        print_result(config.files.front(), outcome);
        return outcome.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int upload_batch(const ClientConfig &config, const TransferProfile &profile, NegotiationClient &negotiation,
                     TransferEngine &engine, const Logger &logger, CancellationToken &cancel)
    {
        std::mutex output_mutex;
        BatchUploader uploader(profile, config.options, negotiation, engine, logger);

        // Several bars cannot share one terminal line; report quarter milestones instead.
        const auto progress = [&output_mutex](std::size_t /*index*/, const std::string &path) -> ProgressObserver
        {
            auto last_quarter = std::make_shared<int>(-1);
            return [&output_mutex, path, last_quarter](const TransferProgressSample &sample)
            {
                const auto percent = sample.total_bytes == 0
                                         ? 100
                                         : static_cast<int>(sample.bytes_sent * 100 / sample.total_bytes);
                const int quarter = percent / 25;
                if (quarter == *last_quarter)
                {
                    return;
                }
                *last_quarter = quarter;
                std::lock_guard<std::mutex> lock(output_mutex);
                std::cerr << path << ": " << quarter * 25 << "%" << std::endl;
            };
        };

        const auto outcomes = uploader.upload_all(config.files, progress, &cancel);

        std::size_t failures = 0;
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            print_result(config.files[i], outcomes[i]);
            if (!outcomes[i].succeeded())
            {
                ++failures;
            }
        }
        std::cout << (outcomes.size() - failures) << " of " << outcomes.size() << " uploads succeeded" << std::endl;
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto config = parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << "Uplink " << uplink::version() << "\n"
                      << usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (config.show_version)
        {
            std::cout << "uplink " << uplink::version() << std::endl;
            return EXIT_SUCCESS;
        }

        Logger logger(config.log_path, config.verbose);
        const auto profile = profile_for(config.profile);
        logger.log("main", "uplink ", uplink::version(), " profile=", to_string(profile.kind),
                   " files=", config.files.size());

        HttpNegotiationClient negotiation(ApiEndpoint{config.api_url, config.api_key, config.api_timeout}, logger);
        HttpTransferEngine engine(profile, logger);

        CancellationToken cancel;
        InterruptWatcher interrupts(cancel);

        if (config.files.size() == 1)
        {
            return upload_single(config, profile, negotiation, engine, logger, cancel);
        }
        return upload_batch(config, profile, negotiation, engine, logger, cancel);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
