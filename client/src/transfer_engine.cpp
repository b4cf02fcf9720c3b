#include "uplink/client/transfer_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <span>
#include <utility>
#include <vector>

#include "uplink/client/http_client.hpp"
#include "uplink/crypto.hpp"
#include "uplink/error_codes.hpp"

namespace uplink::client
{

    namespace
    {

        constexpr std::size_t kMaxErrorBodyInMessage = 256;

        class ProgressReporter
        {
        public:
            ProgressReporter(const ProgressObserver &observer, std::uint64_t total)
                : observer_(observer),
                  total_(total),
                  start_(std::chrono::steady_clock::now()) {}

            void report(std::uint64_t bytes_sent) const
            {
                if (!observer_)
                {
                    return;
                }
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_);
                observer_(TransferProgressSample{
                    .bytes_sent = bytes_sent,
                    .total_bytes = total_,
                    .elapsed_millis = static_cast<std::uint64_t>(elapsed.count()),
                });
            }

        private:
            const ProgressObserver &observer_;
            std::uint64_t total_;
            std::chrono::steady_clock::time_point start_;
        };

        void throw_if_cancelled(const CancellationToken *cancel)
        {
            if (cancel && cancel->is_cancelled())
            {
                throw UploadFailure(ErrorCode::Cancelled, "transfer cancelled");
            }
        }

        // A dropped connection after bytes were acknowledged is a stalled transfer.
        ErrorCode classify(const TransportError &error)
        {
            if (error.timed_out() || error.bytes_acknowledged() > 0)
            {
                return ErrorCode::Timeout;
            }
            return ErrorCode::NetworkError;
        }

        [[noreturn]] void reject(const HttpResponse &response)
        {
            auto message = "storage responded with HTTP " + std::to_string(response.status);
            if (!response.body.empty())
            {
                message += ": " + response.body.substr(0, kMaxErrorBodyInMessage);
            }
            throw UploadFailure(ErrorCode::RemoteRejected, message, static_cast<int>(response.status));
        }

    } // namespace

    HttpTransferEngine::HttpTransferEngine(TransferProfile profile, Logger logger)
        : profile_(std::move(profile)),
          logger_(std::move(logger)) {}

    TransferReceipt HttpTransferEngine::transfer(const NegotiatedDestination &destination,
                                                 const FileDescriptor &descriptor, TransferStrategy strategy,
                                                 const ProgressObserver &on_progress,
                                                 const CancellationToken *cancel)
    {
        if (!is_http_url(destination.write_url))
        {
            throw UploadFailure(ErrorCode::ServerRejected, "negotiated write URL is not a valid http(s) URL");
        }
        throw_if_cancelled(cancel);

        std::ifstream in(descriptor.absolute_path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadFailure(ErrorCode::Unreadable, "cannot open " + descriptor.absolute_path.string());
        }

        const auto total = descriptor.size_bytes;
        const auto chunk_size = stream_chunk_size(profile_);
        HttpRequest request{
            .method = "PUT",
            .url = destination.write_url,
            .headers = {
                "Content-Type: " + descriptor.mime_type,
                // Lets storage refuse the upload (e.g. 413) before the body is sent.
                "Expect: 100-continue",
            },
            .content_length = total,
            .upload_buffer_size = chunk_size,
            .timeout = profile_.timeout,
        };

        logger_.log("transfer", "PUT ", to_string(strategy), ' ', total, " bytes");

        const ProgressReporter progress(on_progress, total);
        crypto::StreamHasher hasher;
        std::uint64_t sent = 0;
        std::vector<std::byte> buffer;

        if (strategy == TransferStrategy::Buffered)
        {
            buffer.resize(static_cast<std::size_t>(total));
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::uint64_t>(in.gcount()) != total)
            {
                throw UploadFailure(ErrorCode::Unreadable, "file changed size while reading");
            }
            hasher.update(buffer);
            request.source = [&buffer, &sent](std::span<std::byte> out) -> std::size_t
            {
                const auto count = static_cast<std::size_t>(
                    std::min<std::uint64_t>(out.size(), buffer.size() - sent));
                std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(sent), count, out.begin());
                sent += count;
                return count;
            };
        }
        else
        {
            request.source = [&](std::span<std::byte> out) -> std::size_t
            {
                if (sent >= total)
                {
                    return 0;
                }
                throw_if_cancelled(cancel);
                const auto wanted = static_cast<std::size_t>(
                    std::min<std::uint64_t>({out.size(), chunk_size, total - sent}));
                in.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(wanted));
                const auto read_count = static_cast<std::size_t>(in.gcount());
                if (read_count == 0)
                {
                    throw UploadFailure(ErrorCode::Unreadable, "file shrank while streaming");
                }
                hasher.update(out.first(read_count));
                sent += read_count;
                progress.report(sent);
                return read_count;
            };
        }

        progress.report(0);
        throw_if_cancelled(cancel);

        HttpResponse response;
        try
        {
            response = perform_request(request);
        }
        catch (const UploadFailure &)
        {
            throw;
        }
        catch (const TransportError &ex)
        {
            // Storage may answer (e.g. 413) and close before the body is fully sent.
            if (!ex.timed_out() && ex.status() >= 300)
            {
                logger_.log("error", "storage rejected upload early: HTTP ", ex.status());
                reject(ex.partial_response());
            }
            logger_.log("error", "transfer failed after ", ex.bytes_acknowledged(), " bytes: ", ex.what());
            throw UploadFailure(classify(ex), ex.what());
        }
        catch (const std::runtime_error &ex)
        {
            throw UploadFailure(ErrorCode::NetworkError, std::string("transfer failed: ") + ex.what());
        }

        if (!is_success(response.status))
        {
            logger_.log("error", "storage rejected upload: HTTP ", response.status);
            reject(response);
        }
        if (strategy == TransferStrategy::Buffered)
        {
            progress.report(sent);
        }

        logger_.log("transfer", "stored ", sent, " bytes, HTTP ", response.status);
        return TransferReceipt{
            .bytes_sent = sent,
            .status_code = static_cast<int>(response.status),
            .content_digest = hasher.finish(),
        };
    }

} // namespace uplink::client
