/**
 * Uplink - Content digests built on libsodium (BLAKE2b generichash).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace uplink::crypto
{

    // Digest of a whole file, read in 64 KiB pieces.
    std::string hash_file(const std::filesystem::path &path);

    /**
     * Incremental digest over data handed to it piecewise, e.g. the chunks of a
     * streamed upload. finish() may be called once.
     */
    class StreamHasher
    {
    public:
        StreamHasher();
        ~StreamHasher();

        StreamHasher(const StreamHasher &) = delete;
        StreamHasher &operator=(const StreamHasher &) = delete;

        void update(std::span<const std::byte> data);
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

} // namespace uplink::crypto
