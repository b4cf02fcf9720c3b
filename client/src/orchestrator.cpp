#include "uplink/client/orchestrator.hpp"

#include <array>
#include <utility>

#include "uplink/client/file_probe.hpp"

namespace uplink::client
{

    namespace
    {

        struct StateMapping
        {
            UploadState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 8> kStateMappings{{
            {UploadState::Idle, "idle"},
            {UploadState::Probing, "probing"},
            {UploadState::Planning, "planning"},
            {UploadState::Negotiating, "negotiating"},
            {UploadState::Transferring, "transferring"},
            {UploadState::Finalizing, "finalizing"},
            {UploadState::Done, "done"},
            {UploadState::Failed, "failed"},
        }};

    } // namespace

    std::string_view to_string(UploadState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    UploadOrchestrator::UploadOrchestrator(TransferProfile profile, UploadOptions options,
                                           NegotiationClient &negotiation, TransferEngine &engine, Logger logger)
        : profile_(std::move(profile)),
          options_(std::move(options)),
          negotiation_(negotiation),
          engine_(engine),
          logger_(std::move(logger)),
          max_file_size_(kMaxFileSize) {}

    UploadOutcome UploadOrchestrator::run(const std::string &path, const ProgressObserver &on_progress,
                                          const CancellationToken *cancel)
    {
        discard_run_state();
        state_ = UploadState::Idle;

        UploadOutcome outcome;
        try
        {
            transition(UploadState::Probing);
            descriptor_ = probe_file(path, max_file_size_);
            logger_.log("probe", descriptor_->absolute_path.string(), " ", descriptor_->size_bytes, " bytes ",
                        descriptor_->mime_type);
            if (!is_supported_mime_type(descriptor_->mime_type))
            {
                logger_.log("warning", "file type ", descriptor_->mime_type, " may not be optimally supported");
            }

            transition(UploadState::Planning);
            strategy_ = plan_transfer(*descriptor_, profile_);
            outcome.strategy = strategy_;
            logger_.log("plan", to_string(*strategy_), " transfer with profile ", to_string(profile_.kind));

            check_cancelled(cancel);
            transition(UploadState::Negotiating);
            destination_ = negotiation_.begin_upload(*descriptor_, options_);

            check_cancelled(cancel);
            transition(UploadState::Transferring);
            const auto receipt = engine_.transfer(*destination_, *descriptor_, *strategy_, on_progress, cancel);
            outcome.content_digest = receipt.content_digest;
            logger_.log("transfer", "sent ", receipt.bytes_sent, " bytes, blake2b ", receipt.content_digest);

            transition(UploadState::Finalizing);
            auto opaque_key = std::move(destination_->opaque_key);
            destination_.reset();
            auto result = negotiation_.complete_upload(opaque_key, options_);
            if (result.final_size_bytes == 0)
            {
                result.final_size_bytes = descriptor_->size_bytes;
            }
            if (result.mime_type.empty())
            {
                result.mime_type = descriptor_->mime_type;
            }
            if (result.original_name.empty())
            {
                result.original_name = descriptor_->display_name;
            }

            transition(UploadState::Done);
            logger_.log("done", result.url);
            outcome.state = UploadState::Done;
            outcome.result = std::move(result);
            discard_run_state();
            return outcome;
        }
        catch (const UploadFailure &failure)
        {
            auto failed = fail(failure.error());
            failed.strategy = outcome.strategy;
            failed.content_digest = outcome.content_digest;
            return failed;
        }
        catch (const std::exception &ex)
        {
            auto failed = fail(UploadError{.code = ErrorCode::InternalError, .message = ex.what(), .http_status = {}});
            failed.strategy = outcome.strategy;
            return failed;
        }
    }

    void UploadOrchestrator::transition(UploadState next)
    {
        logger_.log("state", to_string(state_), " -> ", to_string(next));
        state_ = next;
        if (listener_)
        {
            listener_(next);
        }
    }

    void UploadOrchestrator::check_cancelled(const CancellationToken *cancel) const
    {
        if (cancel && cancel->is_cancelled())
        {
            throw UploadFailure(ErrorCode::Cancelled, "upload cancelled");
        }
    }

    void UploadOrchestrator::discard_run_state() noexcept
    {
        descriptor_.reset();
        strategy_.reset();
        destination_.reset();
    }

    UploadOutcome UploadOrchestrator::fail(UploadError error)
    {
        const auto failed_during = state_;
        logger_.log("error", to_string(failed_during), " failed: ", to_string(error.code), " ", error.message);
        discard_run_state();
        transition(UploadState::Failed);

        UploadOutcome outcome;
        outcome.state = UploadState::Failed;
        outcome.failed_during = failed_during;
        outcome.error = std::move(error);
        return outcome;
    }

} // namespace uplink::client
