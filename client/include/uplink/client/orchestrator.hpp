#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "uplink/client/logger.hpp"
#include "uplink/client/negotiation_client.hpp"
#include "uplink/client/transfer_engine.hpp"
#include "uplink/client/transfer_planner.hpp"
#include "uplink/client/types.hpp"
#include "uplink/error_codes.hpp"

namespace uplink::client
{

    enum class UploadState : std::uint8_t
    {
        Idle,
        Probing,
        Planning,
        Negotiating,
        Transferring,
        Finalizing,
        Done,
        Failed
    };

    std::string_view to_string(UploadState state) noexcept;

    struct UploadOutcome
    {
        UploadState state{UploadState::Idle};
        // Stage that was running when the run failed.
        UploadState failed_during{UploadState::Idle};
        std::optional<UploadResult> result{};
        std::optional<UploadError> error{};
        std::optional<TransferStrategy> strategy{};
        std::string content_digest{};

        bool succeeded() const noexcept { return state == UploadState::Done; }
    };

    using StateListener = std::function<void(UploadState)>;

    /**
     * Drives one upload: probe, plan, negotiate, transfer, finalize.
     *
     * The orchestrator is the only holder of cross-phase state (descriptor,
     * strategy, negotiated destination) and clears it whenever it reaches Done
     * or Failed. A failed run is never resumed; calling run() again starts over
     * with a fresh negotiation.
     */
    class UploadOrchestrator
    {
    public:
        UploadOrchestrator(TransferProfile profile, UploadOptions options, NegotiationClient &negotiation,
                           TransferEngine &engine, Logger logger);

        UploadOutcome run(const std::string &path, const ProgressObserver &on_progress = {},
                          const CancellationToken *cancel = nullptr);

        void set_state_listener(StateListener listener) { listener_ = std::move(listener); }
        void set_max_file_size(std::uint64_t max_size) noexcept { max_file_size_ = max_size; }

        UploadState state() const noexcept { return state_; }
        const TransferProfile &profile() const noexcept { return profile_; }
        const UploadOptions &options() const noexcept { return options_; }

    private:
        void transition(UploadState next);
        void check_cancelled(const CancellationToken *cancel) const;
        void discard_run_state() noexcept;
        UploadOutcome fail(UploadError error);

        TransferProfile profile_;
        UploadOptions options_;
        NegotiationClient &negotiation_;
        TransferEngine &engine_;
        Logger logger_;
        StateListener listener_;
        std::uint64_t max_file_size_;

        UploadState state_{UploadState::Idle};
        std::optional<FileDescriptor> descriptor_;
        std::optional<TransferStrategy> strategy_;
        std::optional<NegotiatedDestination> destination_;
    };

} // namespace uplink::client
