#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "uplink/client/batch_uploader.hpp"
#include "uplink/client/orchestrator.hpp"
#include "uplink/error_codes.hpp"

using namespace uplink;
using namespace uplink::client;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path write_file(const std::filesystem::path &path, std::size_t size)
    {
        std::ofstream file(path, std::ios::binary);
        const std::string block(64 * 1024, 'u');
        std::size_t written = 0;
        while (written < size)
        {
            const auto count = std::min(block.size(), size - written);
            file.write(block.data(), static_cast<std::streamsize>(count));
            written += count;
        }
        return path;
    }

    // Shared by the fakes so the relative order of calls is visible.
    class CallLog
    {
    public:
        void record(std::string call)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(std::move(call));
        }

        std::vector<std::string> calls() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        std::size_t count(const std::string &call) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<std::size_t>(std::count(calls_.begin(), calls_.end(), call));
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> calls_;
    };

    class FakeNegotiation : public NegotiationClient
    {
    public:
        explicit FakeNegotiation(CallLog &log) : log_(log) {}

        NegotiatedDestination begin_upload(const FileDescriptor &descriptor, const UploadOptions &options) override
        {
            log_.record("begin");
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_begin_options = options;
            }
            if (begin_failure)
            {
                throw UploadFailure(*begin_failure, "server said no");
            }
            return NegotiatedDestination{
                .write_url = "https://storage.local/put/" + descriptor.display_name,
                .opaque_key = "uploads/" + descriptor.display_name,
            };
        }

        UploadResult complete_upload(const std::string &opaque_key, const UploadOptions &options) override
        {
            log_.record("complete");
            std::lock_guard<std::mutex> lock(mutex_);
            completed_keys.push_back(opaque_key);
            last_complete_options = options;
            UploadResult result;
            result.remote_id = opaque_key;
            result.url = "https://cdn.local/" + opaque_key;
            return result;
        }

        std::optional<ErrorCode> begin_failure;
        std::optional<UploadOptions> last_begin_options;
        std::optional<UploadOptions> last_complete_options;
        std::vector<std::string> completed_keys;

    private:
        CallLog &log_;
        std::mutex mutex_;
    };

    class FakeEngine : public TransferEngine
    {
    public:
        explicit FakeEngine(CallLog &log) : log_(log) {}

        TransferReceipt transfer(const NegotiatedDestination &destination, const FileDescriptor &descriptor,
                                 TransferStrategy strategy, const ProgressObserver &on_progress,
                                 const CancellationToken *) override
        {
            log_.record("transfer");
            const auto now_active = active_.fetch_add(1) + 1;
            auto peak = peak_active.load();
            while (now_active > peak && !peak_active.compare_exchange_weak(peak, now_active))
            {
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_strategy = strategy;
                last_write_url = destination.write_url;
            }
            if (delay.count() > 0)
            {
                std::this_thread::sleep_for(delay);
            }
            active_.fetch_sub(1);

            if (failure)
            {
                throw UploadFailure(failure->code, failure->message, failure->http_status);
            }
            if (throw_unexpected)
            {
                throw std::runtime_error("socket exploded");
            }
            if (on_progress)
            {
                on_progress(TransferProgressSample{.bytes_sent = 0, .total_bytes = descriptor.size_bytes});
                on_progress(TransferProgressSample{.bytes_sent = descriptor.size_bytes,
                                                   .total_bytes = descriptor.size_bytes,
                                                   .elapsed_millis = 10});
            }
            return TransferReceipt{.bytes_sent = descriptor.size_bytes, .status_code = 200, .content_digest = "digest"};
        }

        std::optional<UploadError> failure;
        bool throw_unexpected{};
        std::chrono::milliseconds delay{0};
        std::atomic<std::size_t> peak_active{0};
        std::optional<TransferStrategy> last_strategy;
        std::string last_write_url;

    private:
        CallLog &log_;
        std::mutex mutex_;
        std::atomic<std::size_t> active_{0};
    };

    const UploadOptions kRoundTripOptions{
        .preserve_original_name = true,
        .optimize = false,
        .generate_thumbnails = false,
        .custom_display_name = "",
        .is_public = true,
    };

    std::filesystem::path make_temp_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    void test_round_trip()
    {
        const auto root = make_temp_root("uplink_orchestrator_round_trip");
        const auto file = write_file(root / "photo.png", 10 * 1024 * 1024);

        CallLog log;
        FakeNegotiation negotiation(log);
        FakeEngine engine(log);
        UploadOrchestrator orchestrator(profile_for(ProfileKind::Medium), kRoundTripOptions, negotiation, engine, Logger());

        std::vector<UploadState> states;
        orchestrator.set_state_listener([&states](UploadState state)
                                        { states.push_back(state); });
        std::vector<TransferProgressSample> samples;
        const auto outcome = orchestrator.run(file.string(), [&samples](const TransferProgressSample &sample)
                                              { samples.push_back(sample); });

        assert(outcome.succeeded());
        assert(outcome.state == UploadState::Done);
        assert(orchestrator.state() == UploadState::Done);
        assert(log.calls() == (std::vector<std::string>{"begin", "transfer", "complete"}));
        assert(states == (std::vector<UploadState>{UploadState::Probing, UploadState::Planning,
                                                   UploadState::Negotiating, UploadState::Transferring,
                                                   UploadState::Finalizing, UploadState::Done}));

        assert(outcome.result);
        assert(!outcome.result->url.empty());
        assert(outcome.result->final_size_bytes == 10 * 1024 * 1024);
        assert(outcome.result->mime_type == "image/png");
        assert(outcome.result->original_name == "photo.png");
        assert(!outcome.error);
        assert(outcome.strategy == TransferStrategy::Buffered);
        assert(outcome.content_digest == "digest");

        assert(engine.last_strategy == TransferStrategy::Buffered);
        assert(engine.last_write_url == "https://storage.local/put/photo.png");
        assert(negotiation.completed_keys == std::vector<std::string>{"uploads/photo.png"});
        assert(negotiation.last_begin_options && !negotiation.last_begin_options->optimize);
        assert(!negotiation.last_begin_options->generate_thumbnails);
        assert(negotiation.last_complete_options && negotiation.last_complete_options->is_public);
        assert(samples.size() == 2);
        assert(samples.back().bytes_sent == samples.back().total_bytes);

        cleanup_path(root);
    }

    void test_negotiation_failure_skips_transfer()
    {
        const auto root = make_temp_root("uplink_orchestrator_phase1");
        const auto file = write_file(root / "report.pdf", 2048);

        CallLog log;
        FakeNegotiation negotiation(log);
        negotiation.begin_failure = ErrorCode::ServerRejected;
        FakeEngine engine(log);
        UploadOrchestrator orchestrator(profile_for(ProfileKind::Medium), kRoundTripOptions, negotiation, engine, Logger());

        const auto outcome = orchestrator.run(file.string());
        assert(outcome.state == UploadState::Failed);
        assert(outcome.failed_during == UploadState::Negotiating);
        assert(outcome.error && outcome.error->code == ErrorCode::ServerRejected);
        assert(!outcome.result);
        assert(log.count("transfer") == 0);
        assert(log.count("complete") == 0);

        cleanup_path(root);
    }

    void test_oversize_rejection_during_transfer()
    {
        const auto root = make_temp_root("uplink_orchestrator_413");
        const auto file = write_file(root / "movie.mp4", 4096);

        CallLog log;
        FakeNegotiation negotiation(log);
        FakeEngine engine(log);
        engine.failure = UploadError{.code = ErrorCode::RemoteRejected, .message = "entity too large", .http_status = 413};
        UploadOrchestrator orchestrator(profile_for(ProfileKind::Fast), kRoundTripOptions, negotiation, engine, Logger());

        const auto outcome = orchestrator.run(file.string());
        assert(outcome.state == UploadState::Failed);
        assert(outcome.failed_during == UploadState::Transferring);
        assert(outcome.error);
        assert(outcome.error->code == ErrorCode::RemoteRejected);
        assert(outcome.error->http_status == 413);
        assert(outcome.error->is_oversize());
        assert(user_message(*outcome.error) == user_message(UploadError{.code = ErrorCode::FileTooLarge}));
        assert(log.calls() == (std::vector<std::string>{"begin", "transfer"}));

        cleanup_path(root);
    }

    void test_probe_failure_and_rerun()
    {
        const auto root = make_temp_root("uplink_orchestrator_rerun");
        const auto file = write_file(root / "notes.txt", 100);

        CallLog log;
        FakeNegotiation negotiation(log);
        FakeEngine engine(log);
        engine.failure = UploadError{.code = ErrorCode::NetworkError, .message = "connection reset"};
        UploadOrchestrator orchestrator(profile_for(ProfileKind::Slow), UploadOptions{}, negotiation, engine, Logger());

        const auto traversal = orchestrator.run("../../etc/passwd");
        assert(traversal.state == UploadState::Failed);
        assert(traversal.failed_during == UploadState::Probing);
        assert(traversal.error->code == ErrorCode::InvalidPath);
        assert(log.calls().empty());

        const auto directory = orchestrator.run(root.string());
        assert(directory.error->code == ErrorCode::NotAFile);
        assert(log.calls().empty());

        const auto dropped = orchestrator.run(file.string());
        assert(dropped.error->code == ErrorCode::NetworkError);
        assert(is_retryable(dropped.error->code));

        // A repeated run negotiates again from scratch.
        engine.failure.reset();
        const auto retried = orchestrator.run(file.string());
        assert(retried.succeeded());
        assert(log.count("begin") == 2);
        assert(log.count("complete") == 1);

        orchestrator.set_max_file_size(10);
        const auto capped = orchestrator.run(file.string());
        assert(capped.error->code == ErrorCode::FileTooLarge);
        assert(log.count("begin") == 2);

        cleanup_path(root);
    }

    void test_cancellation_and_unexpected_errors()
    {
        const auto root = make_temp_root("uplink_orchestrator_cancel");
        const auto file = write_file(root / "clip.webm", 512);

        CallLog log;
        FakeNegotiation negotiation(log);
        FakeEngine engine(log);
        UploadOrchestrator orchestrator(profile_for(ProfileKind::Medium), UploadOptions{}, negotiation, engine, Logger());

        CancellationToken cancel;
        cancel.cancel();
        const auto cancelled = orchestrator.run(file.string(), {}, &cancel);
        assert(cancelled.state == UploadState::Failed);
        assert(cancelled.failed_during == UploadState::Planning);
        assert(cancelled.error->code == ErrorCode::Cancelled);
        assert(log.calls().empty());

        engine.throw_unexpected = true;
        const auto broken = orchestrator.run(file.string());
        assert(broken.error->code == ErrorCode::InternalError);
        assert(broken.error->message == "socket exploded");
        assert(log.count("complete") == 0);

        cleanup_path(root);
    }

    void test_batch_upload()
    {
        const auto root = make_temp_root("uplink_batch_upload");
        std::vector<std::string> paths;
        for (int i = 0; i < 5; ++i)
        {
            paths.push_back(write_file(root / ("file" + std::to_string(i) + ".txt"), 1000 + i).string());
        }
        paths.insert(paths.begin() + 2, (root / "missing.txt").string());

        CallLog log;
        FakeNegotiation negotiation(log);
        FakeEngine engine(log);
        engine.delay = std::chrono::milliseconds(50);
        const auto profile = profile_for(ProfileKind::Medium);
        BatchUploader uploader(profile, UploadOptions{}, negotiation, engine, Logger());

        std::atomic<std::size_t> observers{0};
        const auto outcomes = uploader.upload_all(paths, [&observers](std::size_t, const std::string &) -> ProgressObserver
                                                  {
                                                      observers.fetch_add(1);
                                                      return {}; });

        assert(outcomes.size() == paths.size());
        assert(observers.load() == paths.size());
        for (std::size_t i = 0; i < paths.size(); ++i)
        {
            if (i == 2)
            {
                assert(outcomes[i].error && outcomes[i].error->code == ErrorCode::InvalidPath);
                continue;
            }
            assert(outcomes[i].succeeded());
            const auto name = std::filesystem::path(paths[i]).filename().string();
            assert(outcomes[i].result->url == "https://cdn.local/uploads/" + name);
        }
        assert(log.count("transfer") == 5);
        assert(engine.peak_active.load() <= profile.max_concurrent_uploads);
        assert(uploader.peak_concurrency() >= 1);
        assert(uploader.peak_concurrency() <= profile.max_concurrent_uploads);

        CancellationToken cancel;
        cancel.cancel();
        const auto cancelled = uploader.upload_all(paths, {}, &cancel);
        for (const auto &outcome : cancelled)
        {
            assert(!outcome.succeeded());
        }
        assert(log.count("transfer") == 5);

        assert(uploader.upload_all({}).empty());

        cleanup_path(root);
    }

} // namespace

void run_orchestrator_tests()
{
    test_round_trip();
    test_negotiation_failure_skips_transfer();
    test_oversize_rejection_during_transfer();
    test_probe_failure_and_rerun();
    test_cancellation_and_unexpected_errors();
    test_batch_upload();
}
