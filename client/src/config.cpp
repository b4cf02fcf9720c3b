#include "uplink/client/config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

#include "uplink/client/http_client.hpp"

namespace uplink::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        constexpr std::uint32_t kMaxApiTimeoutSeconds = 24 * 60 * 60;

        std::chrono::seconds parse_api_timeout(const std::string &value)
        {
            std::uint32_t seconds = 0;
            const auto *first = value.data();
            const auto *last = value.data() + value.size();
            const auto [end, ec] = std::from_chars(first, last, seconds);
            if (ec != std::errc() || end != last || value.empty())
            {
                throw std::runtime_error("--api-timeout expects a whole number of seconds, got " + value);
            }
            if (seconds == 0 || seconds > kMaxApiTimeoutSeconds)
            {
                throw std::runtime_error("--api-timeout must be between 1 and " +
                                         std::to_string(kMaxApiTimeoutSeconds) + " seconds");
            }
            return std::chrono::seconds(seconds);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        return parse_arguments(argc, argv, [](const char *name) -> std::optional<std::string>
                               {
                                   const char *value = std::getenv(name);
                                   if (value == nullptr || *value == '\0')
                                   {
                                       return std::nullopt;
                                   }
                                   return std::string(value); });
    }

    ClientConfig parse_arguments(int argc, char *argv[], const EnvironmentLookup &environment)
    {
        ClientConfig config;
        std::optional<std::string> api_url;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--version" || arg == "-v")
            {
                config.show_version = true;
            }
            else if (arg == "--api-url")
            {
                api_url = require_value(index, argc, argv, arg);
            }
            else if (arg == "--profile")
            {
                const auto value = require_value(index, argc, argv, arg);
                const auto kind = profile_kind_from_string(value);
                if (!kind)
                {
                    throw std::runtime_error("Unknown profile: " + value + " (expected slow, medium, fast or ultra)");
                }
                config.profile = *kind;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--name")
            {
                config.options.custom_display_name = require_value(index, argc, argv, arg);
            }
            else if (arg == "--no-preserve-name")
            {
                config.options.preserve_original_name = false;
            }
            else if (arg == "--no-optimize")
            {
                config.options.optimize = false;
            }
            else if (arg == "--no-thumbnails")
            {
                config.options.generate_thumbnails = false;
            }
            else if (arg == "--private")
            {
                config.options.is_public = false;
            }
            else if (arg == "--api-timeout")
            {
                config.api_timeout = parse_api_timeout(require_value(index, argc, argv, arg));
            }
            else if (!arg.empty() && arg.front() == '-' && arg != "-")
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.files.push_back(arg);
            }
        }

        if (config.show_help || config.show_version)
        {
            return config;
        }
        if (config.files.empty())
        {
            throw std::runtime_error("No files given");
        }

        config.api_url = api_url ? *api_url : environment("UPLINK_API_URL").value_or("");
        if (config.api_url.empty())
        {
            throw std::runtime_error("API URL required: pass --api-url or set UPLINK_API_URL");
        }
        if (!is_http_url(config.api_url))
        {
            throw std::runtime_error("API URL must be an http:// or https:// URL: " + config.api_url);
        }

        config.api_key = environment("UPLINK_API_KEY").value_or("");
        if (config.api_key.empty())
        {
            throw std::runtime_error("No API key: set UPLINK_API_KEY");
        }
        return config;
    }

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " [options] <file>...\n"
               "  --api-url <URL>        API base URL (default: $UPLINK_API_URL)\n"
               "  --profile <NAME>       slow | medium | fast | ultra (default: medium)\n"
               "  --name <NAME>          custom display name\n"
               "  --no-preserve-name     let the server rename the file\n"
               "  --no-optimize          skip server-side optimization\n"
               "  --no-thumbnails        skip thumbnail generation\n"
               "  --private              do not publish the file\n"
               "  --api-timeout <SEC>    timeout for API calls (default: 30)\n"
               "  --log <FILE>           write a log file\n"
               "  --verbose              log to stderr\n"
               "  -h, --help             show this help\n"
               "  -v, --version          show version\n"
               "The API key is read from $UPLINK_API_KEY.\n";
    }

} // namespace uplink::client
