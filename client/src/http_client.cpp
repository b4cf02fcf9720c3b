#include "uplink/client/http_client.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <new>

#include <curl/curl.h>

#include "uplink/version.hpp"

namespace uplink::client
{

    namespace
    {

        void ensure_curl_global_init()
        {
            static std::once_flag once;
            std::call_once(once, []()
                           {
                               if (const auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
                               {
                                   throw TransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc),
                                                        false, 0);
                               } });
        }

        struct EasyHandle
        {
            EasyHandle() : handle(curl_easy_init())
            {
                if (handle == nullptr)
                {
                    throw TransportError("curl_easy_init failed", false, 0);
                }
            }
            ~EasyHandle() { curl_easy_cleanup(handle); }

            EasyHandle(const EasyHandle &) = delete;
            EasyHandle &operator=(const EasyHandle &) = delete;

            CURL *handle;
        };

        struct HeaderList
        {
            HeaderList() = default;
            ~HeaderList()
            {
                if (list != nullptr)
                {
                    curl_slist_free_all(list);
                }
            }

            HeaderList(const HeaderList &) = delete;
            HeaderList &operator=(const HeaderList &) = delete;

            void add(const std::string &line)
            {
                auto *next = curl_slist_append(list, line.c_str());
                if (next == nullptr)
                {
                    throw std::bad_alloc();
                }
                list = next;
            }

            curl_slist *list = nullptr;
        };

        // The read callback runs inside libcurl; failures are parked here and rethrown after perform.
        struct UploadState
        {
            const BodySource *source;
            std::exception_ptr failure;
        };

        template <typename Value>
        void set_option(CURL *handle, CURLoption option, Value value)
        {
            if (const auto rc = curl_easy_setopt(handle, option, value); rc != CURLE_OK)
            {
                throw TransportError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc), false, 0);
            }
        }

    } // namespace

    HttpResponse perform_request(const HttpRequest &request)
    {
        ensure_curl_global_init();
        EasyHandle easy;
        CURL *curl = easy.handle;

        HeaderList headers;
        for (const auto &line : request.headers)
        {
            headers.add(line);
        }

        HttpResponse response;
        UploadState upload{.source = &request.source, .failure = nullptr};
        char error_buffer[CURL_ERROR_SIZE] = {};
        const auto agent = user_agent();

        set_option(curl, CURLOPT_URL, request.url.c_str());
        set_option(curl, CURLOPT_PROTOCOLS_STR, "http,https");
        set_option(curl, CURLOPT_NOSIGNAL, 1L);
        set_option(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        set_option(curl, CURLOPT_USERAGENT, agent.c_str());
        set_option(curl, CURLOPT_HTTPHEADER, headers.list);
        set_option(curl, CURLOPT_ERRORBUFFER, error_buffer);
        set_option(curl, CURLOPT_WRITEDATA, &response.body);
        set_option(curl, CURLOPT_WRITEFUNCTION, +[](char *data, size_t size, size_t count, void *userdata) -> size_t
                   {
                       static_cast<std::string *>(userdata)->append(data, size * count);
                       return size * count; });

        if (request.source)
        {
            set_option(curl, CURLOPT_UPLOAD, 1L);
            set_option(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.content_length));
            set_option(curl, CURLOPT_READDATA, &upload);
            set_option(curl, CURLOPT_READFUNCTION, +[](char *buffer, size_t size, size_t count, void *userdata) -> size_t
                       {
                           auto *state = static_cast<UploadState *>(userdata);
                           try
                           {
                               return (*state->source)(std::span<std::byte>(reinterpret_cast<std::byte *>(buffer), size * count));
                           }
                           catch (const std::exception &)
                           {
                               state->failure = std::current_exception();
                               return CURL_READFUNC_ABORT;
                           } });
            if (request.upload_buffer_size > 0)
            {
                set_option(curl, CURLOPT_UPLOAD_BUFFERSIZE, static_cast<long>(request.upload_buffer_size));
            }
            if (request.method != "PUT")
            {
                set_option(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }
        else if (request.method == "POST")
        {
            set_option(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            set_option(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        }
        else
        {
            set_option(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        const auto code = curl_easy_perform(curl);
        if (upload.failure)
        {
            std::rethrow_exception(upload.failure);
        }

        if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK)
        {
            response.status = 0;
        }
        if (code != CURLE_OK)
        {
            curl_off_t uploaded = 0;
            if (curl_easy_getinfo(curl, CURLINFO_SIZE_UPLOAD_T, &uploaded) != CURLE_OK)
            {
                uploaded = 0;
            }
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
            throw TransportError(detail, code == CURLE_OPERATION_TIMEDOUT, static_cast<std::uint64_t>(uploaded),
                                 std::move(response));
        }
        return response;
    }

    std::string user_agent()
    {
        return "uplink/" + std::string(version());
    }

    bool is_http_url(const std::string &url)
    {
        const std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
        if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
        {
            return false;
        }
        const auto part = [&handle](CURLUPart which) -> std::string
        {
            char *value = nullptr;
            if (curl_url_get(handle.get(), which, &value, 0) != CURLUE_OK || value == nullptr)
            {
                return {};
            }
            std::string result(value);
            curl_free(value);
            return result;
        };
        const auto scheme = part(CURLUPART_SCHEME);
        return (scheme == "http" || scheme == "https") && !part(CURLUPART_HOST).empty();
    }

    std::string join_url(std::string_view base, std::string_view path)
    {
        while (!base.empty() && base.back() == '/')
        {
            base.remove_suffix(1);
        }
        std::string joined(base);
        if (path.empty() || path.front() != '/')
        {
            joined += '/';
        }
        joined += path;
        return joined;
    }

    std::string escape_path_segment(std::string_view segment)
    {
        // curl_easy_escape measures a zero length with strlen.
        if (segment.empty())
        {
            return {};
        }
        ensure_curl_global_init();
        EasyHandle easy;
        char *escaped = curl_easy_escape(easy.handle, segment.data(), static_cast<int>(segment.size()));
        if (escaped == nullptr)
        {
            throw std::runtime_error("curl_easy_escape failed");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

} // namespace uplink::client
