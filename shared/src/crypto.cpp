#include "uplink/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace uplink::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    struct StreamHasher::State
    {
        crypto_generichash_state state;
    };

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        StreamHasher hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (file)
        {
            file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(file.gcount());
            if (read_count > 0)
            {
                hasher.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hasher.finish();
    }

    StreamHasher::StreamHasher()
        : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_->state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    StreamHasher::~StreamHasher() = default;

    void StreamHasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("StreamHasher::update after finish");
        }
        if (crypto_generichash_update(&state_->state, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string StreamHasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("StreamHasher::finish called twice");
        }
        finished_ = true;
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_->state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

} // namespace uplink::crypto
