#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplink/client/config.hpp"
#include "uplink/client/file_probe.hpp"
#include "uplink/client/progress_tracker.hpp"
#include "uplink/client/transfer_planner.hpp"
#include "uplink/error_codes.hpp"

using namespace uplink;
using namespace uplink::client;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::optional<ErrorCode> probe_error(const std::string &path, std::uint64_t max_size = kMaxFileSize)
    {
        try
        {
            (void)probe_file(path, max_size);
        }
        catch (const UploadFailure &failure)
        {
            return failure.code();
        }
        return std::nullopt;
    }

    void test_path_safety()
    {
        assert(!is_safe_path(""));
        assert(!is_safe_path("../../etc/passwd"));
        assert(!is_safe_path("photos/../secret.txt"));
        assert(!is_safe_path("photos\\..\\secret.txt"));
        assert(!is_safe_path(std::string("photo\0.png", 10)));
        assert(!is_safe_path("~/photo.png"));
        assert(!is_safe_path("~root/photo.png"));
        assert(!is_safe_path("~"));
        assert(!is_safe_path("~\\photo.png"));
        assert(is_safe_path("~$budget.xlsx"));
        assert(is_safe_path("~draft.txt"));
        assert(is_safe_path("photos/~draft.txt"));
        assert(!is_safe_path("photos//photo.png"));
        assert(is_safe_path("photos/holiday..final.png"));
        assert(is_safe_path("/tmp/photo.png"));

        assert(probe_error("../../etc/passwd") == ErrorCode::InvalidPath);
        assert(probe_error(std::string("/tmp/photo\0.png", 15)) == ErrorCode::InvalidPath);
    }

    void test_probe_file()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "uplink_probe_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        const auto image = temp_root / "Photo.PNG";
        {
            std::ofstream file(image, std::ios::binary);
            file << "\x89PNG";
        }
        const auto descriptor = probe_file(image.string());
        assert(descriptor.absolute_path == std::filesystem::canonical(image));
        assert(descriptor.absolute_path.is_absolute());
        assert(descriptor.display_name == "Photo.PNG");
        assert(descriptor.size_bytes == 4);
        assert(descriptor.mime_type == "image/png");
        assert(descriptor.modified_at == std::filesystem::last_write_time(image));

        const auto unknown = temp_root / "data.blob42";
        {
            std::ofstream file(unknown, std::ios::binary);
            file << "x";
        }
        assert(probe_file(unknown.string()).mime_type == kDefaultMimeType);

        const auto empty = temp_root / "empty.txt";
        {
            std::ofstream file(empty, std::ios::binary);
        }
        assert(probe_file(empty.string()).size_bytes == 0);

        assert(probe_error((temp_root / "missing.png").string()) == ErrorCode::InvalidPath);
        assert(probe_error(temp_root.string()) == ErrorCode::NotAFile);
        assert(probe_error(image.string(), 3) == ErrorCode::FileTooLarge);
        assert(!probe_error(image.string(), 4));

        cleanup_path(temp_root);
    }

    void test_mime_types()
    {
        assert(mime_type_for("a.jpg") == "image/jpeg");
        assert(mime_type_for("a.JPEG") == "image/jpeg");
        assert(mime_type_for("song.mp3") == "audio/mpeg");
        assert(mime_type_for("clip.mov") == "video/quicktime");
        assert(mime_type_for("Makefile") == kDefaultMimeType);

        assert(is_supported_mime_type("image/png"));
        assert(is_supported_mime_type("application/pdf"));
        assert(!is_supported_mime_type("application/octet-stream"));
        assert(!is_supported_mime_type("video/quicktime"));
    }

    void test_transfer_planner()
    {
        const auto medium = profile_for(ProfileKind::Medium);
        assert(medium.part_size_bytes == 10ULL * 1024 * 1024);
        assert(medium.max_concurrent_uploads == 2);
        assert(medium.timeout == std::chrono::minutes(30));
        assert(profile_for(ProfileKind::Slow).max_concurrent_uploads == 1);
        assert(profile_for(ProfileKind::Ultra).timeout == std::chrono::minutes(10));

        assert(profile_kind_from_string("fast") == ProfileKind::Fast);
        assert(!profile_kind_from_string("warp"));
        assert(to_string(ProfileKind::Ultra) == "ultra");

        FileDescriptor descriptor{.absolute_path = "/tmp/f.bin", .display_name = "f.bin", .size_bytes = 0};
        const std::map<std::uint64_t, TransferStrategy> cases{
            {0, TransferStrategy::Buffered},
            {10ULL * 1024 * 1024, TransferStrategy::Buffered},
            {kStreamingThreshold - 1, TransferStrategy::Buffered},
            {kStreamingThreshold, TransferStrategy::Buffered},
            {kStreamingThreshold + 1, TransferStrategy::Streamed},
            {5ULL * 1024 * 1024 * 1024, TransferStrategy::Streamed},
        };
        for (const auto kind : {ProfileKind::Slow, ProfileKind::Medium, ProfileKind::Fast, ProfileKind::Ultra})
        {
            for (const auto &[size, expected] : cases)
            {
                descriptor.size_bytes = size;
                assert(plan_transfer(descriptor, profile_for(kind)) == expected);
            }
        }

        assert(stream_chunk_size(profile_for(ProfileKind::Slow)) == 5ULL * 1024 * 1024 / 16);
        assert(stream_chunk_size(profile_for(ProfileKind::Ultra)) == kMaxStreamChunk);
        TransferProfile tiny{.kind = ProfileKind::Slow, .part_size_bytes = 1024, .max_concurrent_uploads = 1};
        assert(stream_chunk_size(tiny) == kMinStreamChunk);
    }

    void test_progress_tracker()
    {
        const auto start = std::chrono::steady_clock::now();
        const ProgressTracker tracker(start);
        const std::uint64_t total = 10ULL * 1024 * 1024;

        double last_percent = -1.0;
        for (std::uint64_t sent = 0; sent <= total; sent += total / 7)
        {
            const auto snapshot = tracker.on_sample(TransferProgressSample{
                .bytes_sent = sent, .total_bytes = total, .elapsed_millis = 1000 + sent / 1024});
            assert(snapshot.percent >= last_percent);
            assert(snapshot.percent <= 100.0);
            last_percent = snapshot.percent;
        }
        const auto done = tracker.on_sample(TransferProgressSample{.bytes_sent = total, .total_bytes = total,
                                                                   .elapsed_millis = 4000});
        assert(done.percent == 100.0);

        const auto instant = tracker.on_sample(TransferProgressSample{.bytes_sent = 512, .total_bytes = total,
                                                                      .elapsed_millis = 0});
        assert(instant.bytes_per_second == 0.0);
        assert(instant.eta_label == kEtaCalculating);

        const auto empty = tracker.on_sample(TransferProgressSample{.bytes_sent = 0, .total_bytes = 0,
                                                                    .elapsed_millis = 10});
        assert(empty.percent == 100.0);

        // 1000 bytes/s with 45000 bytes left.
        const auto steady = tracker.on_sample(TransferProgressSample{.bytes_sent = 5000, .total_bytes = 50000,
                                                                     .elapsed_millis = 5000});
        assert(steady.bytes_per_second == 1000.0);
        assert(steady.eta_label == "45s");

        const auto sample = tracker.sample_at(10, 20, start + std::chrono::milliseconds(1500));
        assert(sample.elapsed_millis == 1500);
        assert(tracker.sample_at(10, 20, start - std::chrono::seconds(1)).elapsed_millis == 0);
    }

    void test_progress_formatting()
    {
        assert(format_eta(45) == "45s");
        assert(format_eta(44.2) == "45s");
        assert(format_eta(130) == "2m");
        assert(format_eta(3900) == "1h 5m");
        assert(format_eta(0) == "0s");

        assert(format_bytes(0) == "0 Bytes");
        assert(format_bytes(512) == "512 Bytes");
        assert(format_bytes(1536) == "1.5 KB");
        assert(format_bytes(10ULL * 1024 * 1024) == "10 MB");
        assert(format_bytes(1288490189) == "1.2 GB");

        const ProgressSnapshot snapshot{
            .percent = 50.0,
            .bytes_per_second = 1024.0,
            .eta_label = "5s",
            .bytes_sent = 5120,
            .total_bytes = 10240,
        };
        const auto line = render_progress_line(snapshot, 10);
        assert(line.find("50% (5 KB / 10 KB) 1 KB/s ETA 5s") != std::string::npos);
        assert(line.rfind("█████░░░░░", 0) == 0);
    }

    ClientConfig parse(std::vector<std::string> args, std::map<std::string, std::string> env = {})
    {
        args.insert(args.begin(), "uplink");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data(), [&env](const char *name) -> std::optional<std::string>
                               {
                                   const auto it = env.find(name);
                                   if (it == env.end())
                                   {
                                       return std::nullopt;
                                   }
                                   return it->second; });
    }

    bool parse_fails(std::vector<std::string> args, std::map<std::string, std::string> env = {})
    {
        try
        {
            (void)parse(std::move(args), std::move(env));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_config()
    {
        const std::map<std::string, std::string> env{{"UPLINK_API_URL", "https://api.example.com/v1"},
                                                     {"UPLINK_API_KEY", "secret"}};

        const auto defaults = parse({"photo.png"}, env);
        assert(defaults.files == std::vector<std::string>{"photo.png"});
        assert(defaults.api_url == "https://api.example.com/v1");
        assert(defaults.api_key == "secret");
        assert(defaults.profile == ProfileKind::Medium);
        assert(defaults.options.preserve_original_name);
        assert(defaults.options.optimize);
        assert(defaults.options.generate_thumbnails);
        assert(defaults.options.is_public);
        assert(defaults.api_timeout == std::chrono::seconds(30));

        const auto custom = parse({"--profile", "ultra", "--no-optimize", "--no-thumbnails", "--private",
                                   "--no-preserve-name", "--name", "Holiday", "--api-url", "http://localhost:3000",
                                   "--api-timeout", "5", "--log", "upload.log", "a.png", "b.pdf"},
                                  env);
        assert(custom.profile == ProfileKind::Ultra);
        assert(!custom.options.optimize);
        assert(!custom.options.generate_thumbnails);
        assert(!custom.options.is_public);
        assert(!custom.options.preserve_original_name);
        assert(custom.options.custom_display_name == "Holiday");
        assert(custom.api_url == "http://localhost:3000");
        assert(custom.api_timeout == std::chrono::seconds(5));
        assert(custom.log_path == std::filesystem::path("upload.log"));
        assert(custom.files.size() == 2);

        assert(parse({"--help"}).show_help);
        assert(parse({"--version"}).show_version);

        assert(parse_fails({}, env));
        assert(parse_fails({"photo.png"}));
        assert(parse_fails({"photo.png"}, {{"UPLINK_API_URL", "https://api.example.com"}}));
        assert(parse_fails({"--api-url", "ftp://x", "photo.png"}, env));
        assert(parse_fails({"--profile", "warp", "photo.png"}, env));
        assert(parse_fails({"--bogus", "photo.png"}, env));
        assert(parse_fails({"photo.png", "--name"}, env));

        assert(parse({"--api-timeout", "86400", "photo.png"}, env).api_timeout == std::chrono::hours(24));
        assert(parse_fails({"--api-timeout", "-5", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "+5", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "5abc", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "0", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "86401", "photo.png"}, env));
        assert(parse_fails({"--api-timeout", "99999999999999999999", "photo.png"}, env));
    }

} // namespace

void run_client_component_tests()
{
    test_path_safety();
    test_probe_file();
    test_mime_types();
    test_transfer_planner();
    test_progress_tracker();
    test_progress_formatting();
    test_config();
}
