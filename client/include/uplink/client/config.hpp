#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "uplink/client/transfer_planner.hpp"
#include "uplink/client/types.hpp"

namespace uplink::client
{

    struct ClientConfig
    {
        std::vector<std::string> files;
        std::string api_url;
        std::string api_key;
        ProfileKind profile{ProfileKind::Medium};
        UploadOptions options{};
        std::chrono::milliseconds api_timeout{std::chrono::seconds(30)};
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
        bool show_version{};
    };

    using EnvironmentLookup = std::function<std::optional<std::string>(const char *name)>;

    // Flags override UPLINK_API_URL / UPLINK_API_KEY. Throws std::runtime_error on bad usage.
    ClientConfig parse_arguments(int argc, char *argv[]);
    ClientConfig parse_arguments(int argc, char *argv[], const EnvironmentLookup &environment);

    std::string usage(const char *program_name);

} // namespace uplink::client
