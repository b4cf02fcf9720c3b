#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uplink::client
{

    struct HttpResponse
    {
        long status{0};
        std::string body;
    };

    constexpr bool is_success(long status) noexcept
    {
        return status >= 200 && status < 300;
    }

    /**
     * A request that did not complete. status() holds the HTTP status when the
     * server answered before the exchange broke off (e.g. a 413 sent while the
     * body was still being written), otherwise 0.
     */
    class TransportError : public std::runtime_error
    {
    public:
        TransportError(const std::string &message, bool timed_out, std::uint64_t bytes_acknowledged,
                       HttpResponse partial = {})
            : std::runtime_error(message),
              timed_out_(timed_out),
              bytes_acknowledged_(bytes_acknowledged),
              partial_(std::move(partial)) {}

        bool timed_out() const noexcept { return timed_out_; }
        std::uint64_t bytes_acknowledged() const noexcept { return bytes_acknowledged_; }
        long status() const noexcept { return partial_.status; }
        const HttpResponse &partial_response() const noexcept { return partial_; }

    private:
        bool timed_out_;
        std::uint64_t bytes_acknowledged_;
        HttpResponse partial_;
    };

    // Fills `out` with the next body bytes and returns the count written.
    using BodySource = std::function<std::size_t(std::span<std::byte> out)>;

    struct HttpRequest
    {
        std::string method;
        std::string url;
        std::vector<std::string> headers; // "Name: value"
        std::string body;                 // used when `source` is empty
        BodySource source;
        std::uint64_t content_length{0};  // bytes `source` will produce
        std::size_t upload_buffer_size{0}; // 0 keeps the libcurl default
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    };

    /**
     * One HTTP exchange on a fresh libcurl easy handle. The timeout bounds the
     * whole exchange. Throws TransportError when no complete response arrived;
     * an exception thrown by the body source aborts the transfer and is
     * rethrown unchanged.
     */
    HttpResponse perform_request(const HttpRequest &request);

    std::string user_agent();

    // True for an absolute http:// or https:// URL with a host.
    bool is_http_url(const std::string &url);

    std::string join_url(std::string_view base, std::string_view path);

    // Percent-encodes everything outside the RFC 3986 unreserved set.
    std::string escape_path_segment(std::string_view segment);

} // namespace uplink::client
