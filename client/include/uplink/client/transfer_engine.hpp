#pragma once

#include "uplink/client/logger.hpp"
#include "uplink/client/transfer_planner.hpp"
#include "uplink/client/types.hpp"

namespace uplink::client
{

    /**
     * Sends the file bytes to a negotiated destination. One call is one
     * attempt: there is no retry and a half-sent stream is never resumed.
     *
     * Throws UploadFailure with NetworkError, Timeout, RemoteRejected (with the
     * HTTP status), Unreadable or Cancelled.
     */
    class TransferEngine
    {
    public:
        virtual ~TransferEngine() = default;

        virtual TransferReceipt transfer(const NegotiatedDestination &destination, const FileDescriptor &descriptor,
                                         TransferStrategy strategy, const ProgressObserver &on_progress,
                                         const CancellationToken *cancel) = 0;
    };

    class HttpTransferEngine : public TransferEngine
    {
    public:
        HttpTransferEngine(TransferProfile profile, Logger logger);

        TransferReceipt transfer(const NegotiatedDestination &destination, const FileDescriptor &descriptor,
                                 TransferStrategy strategy, const ProgressObserver &on_progress,
                                 const CancellationToken *cancel) override;

    private:
        TransferProfile profile_;
        Logger logger_;
    };

} // namespace uplink::client
