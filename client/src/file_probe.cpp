#include "uplink/client/file_probe.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <system_error>

#include "uplink/error_codes.hpp"

namespace uplink::client
{

    namespace
    {

        struct MimeMapping
        {
            std::string_view extension;
            std::string_view mime_type;
        };

        constexpr std::array<MimeMapping, 43> kMimeMappings{{
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".svg", "image/svg+xml"},
            {".bmp", "image/bmp"},
            {".ico", "image/vnd.microsoft.icon"},
            {".tif", "image/tiff"},
            {".tiff", "image/tiff"},
            {".avif", "image/avif"},
            {".heic", "image/heic"},
            {".pdf", "application/pdf"},
            {".txt", "text/plain"},
            {".json", "application/json"},
            {".csv", "text/csv"},
            {".md", "text/markdown"},
            {".xml", "application/xml"},
            {".zip", "application/zip"},
            {".rar", "application/x-rar-compressed"},
            {".7z", "application/x-7z-compressed"},
            {".gz", "application/gzip"},
            {".tar", "application/x-tar"},
            {".mp4", "video/mp4"},
            {".avi", "video/x-msvideo"},
            {".mov", "video/quicktime"},
            {".mkv", "video/x-matroska"},
            {".webm", "video/webm"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".ogg", "audio/ogg"},
            {".flac", "audio/flac"},
            {".js", "application/javascript"},
            {".mjs", "text/javascript"},
            {".css", "text/css"},
            {".html", "text/html"},
            {".htm", "text/html"},
            {".doc", "application/msword"},
            {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {".xls", "application/vnd.ms-excel"},
            {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
            {".ppt", "application/vnd.ms-powerpoint"},
            {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        }};

        constexpr std::array<std::string_view, 25> kSupportedMimeTypes{{
            "image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp", "image/svg+xml",
            "application/pdf", "text/plain", "application/json", "text/csv",
            "application/zip", "application/x-rar-compressed", "application/x-7z-compressed",
            "video/mp4", "video/avi", "video/mov", "audio/mp3", "audio/wav", "audio/ogg", "audio/mpeg",
            "text/javascript", "text/css", "text/html", "application/javascript", "text/markdown",
        }};

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        bool has_parent_component(std::string_view path) noexcept
        {
            std::size_t start = 0;
            while (start <= path.size())
            {
                const auto end = path.find_first_of("/\\", start);
                const auto component = path.substr(start, end == std::string_view::npos ? path.size() - start
                                                                                        : end - start);
                if (component == "..")
                {
                    return true;
                }
                if (end == std::string_view::npos)
                {
                    break;
                }
                start = end + 1;
            }
            return false;
        }

        bool is_user_name_char(char ch) noexcept
        {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '_' || ch == '-';
        }

        // "~" alone, "~/..." or "~user/...": shell home-directory shortcuts.
        bool is_home_shortcut(std::string_view path) noexcept
        {
            if (path.empty() || path.front() != '~')
            {
                return false;
            }
            const auto separator = path.find_first_of("/\\");
            if (separator == std::string_view::npos)
            {
                return path.size() == 1;
            }
            const auto user = path.substr(1, separator - 1);
            return std::all_of(user.begin(), user.end(), is_user_name_char);
        }

        [[noreturn]] void fail(ErrorCode code, const std::string &message)
        {
            throw UploadFailure(code, message);
        }

    } // namespace

    bool is_safe_path(std::string_view path) noexcept
    {
        if (path.empty())
        {
            return false;
        }
        if (path.find('\0') != std::string_view::npos)
        {
            return false;
        }
        if (is_home_shortcut(path))
        {
            return false;
        }
        if (path.find("//") != std::string_view::npos)
        {
            return false;
        }
        return !has_parent_component(path);
    }

    std::string mime_type_for(const std::filesystem::path &path)
    {
        const auto extension = to_lower(path.extension().string());
        for (const auto &mapping : kMimeMappings)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.mime_type);
            }
        }
        return std::string(kDefaultMimeType);
    }

    bool is_supported_mime_type(std::string_view mime_type) noexcept
    {
        return std::find(kSupportedMimeTypes.begin(), kSupportedMimeTypes.end(), mime_type) !=
               kSupportedMimeTypes.end();
    }

    FileDescriptor probe_file(const std::string &path, std::uint64_t max_size)
    {
        if (!is_safe_path(path))
        {
            fail(ErrorCode::InvalidPath, "path contains suspicious characters");
        }

        std::error_code ec;
        const std::filesystem::path input(path);
        if (!std::filesystem::exists(input, ec) || ec)
        {
            fail(ErrorCode::InvalidPath, "file does not exist or is not accessible: " + path);
        }

        const auto canonical = std::filesystem::canonical(input, ec);
        if (ec)
        {
            fail(ErrorCode::InvalidPath, "cannot resolve path " + path + ": " + ec.message());
        }

        const auto status = std::filesystem::status(canonical, ec);
        if (ec)
        {
            fail(ErrorCode::Unreadable, "cannot stat " + canonical.string() + ": " + ec.message());
        }
        if (std::filesystem::is_directory(status))
        {
            fail(ErrorCode::NotAFile, canonical.string() + " is a directory");
        }
        if (!std::filesystem::is_regular_file(status))
        {
            fail(ErrorCode::NotAFile, canonical.string() + " is not a regular file");
        }

        const auto size = std::filesystem::file_size(canonical, ec);
        if (ec)
        {
            fail(ErrorCode::Unreadable, "cannot read size of " + canonical.string() + ": " + ec.message());
        }
        const auto modified = std::filesystem::last_write_time(canonical, ec);
        if (ec)
        {
            fail(ErrorCode::Unreadable, "cannot read modification time of " + canonical.string() + ": " +
                                            ec.message());
        }

        {
            std::ifstream in(canonical, std::ios::binary);
            if (!in.is_open())
            {
                fail(ErrorCode::Unreadable, "cannot open " + canonical.string() + " for reading");
            }
        }

        if (size > max_size)
        {
            fail(ErrorCode::FileTooLarge, "file is " + std::to_string(size) + " bytes, limit is " +
                                              std::to_string(max_size));
        }

        return FileDescriptor{
            .absolute_path = canonical,
            .display_name = canonical.filename().string(),
            .size_bytes = size,
            .mime_type = mime_type_for(canonical),
            .modified_at = modified,
        };
    }

} // namespace uplink::client
