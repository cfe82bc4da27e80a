#include <array>
#include <utility>
#include <algorithm>
#include <string_view>
#include <system_error>
#include "sandbox_probe/hash.hpp"
#include "sandbox_probe/media.hpp"
#include "sandbox_probe/utils.hpp"
#include "sandbox_probe/evidence.hpp"

namespace sandbox_probe {

    namespace {
        using Path = std::filesystem::path;
        using FileType = std::filesystem::file_type;

        constexpr std::array<std::string_view, 8> kDiskImageExtensions = {
            ".e01", ".dd", ".raw", ".img", ".vmdk", ".vhd", ".vhdx", ".aff4"};

        bool is_disk_image(const Path& path) {
            const std::string lowered = to_lowercase(path.extension().string());
            return std::any_of(kDiskImageExtensions.begin(), kDiskImageExtensions.end(), [&](std::string_view ext) {
                return lowered == ext;
            });
        }

        struct ExtensionClass {
            bool (*matches)(const Path&);
            const char* type;
        };

        constexpr std::array<ExtensionClass, 4> kExtensionClasses = {{
            {is_image_extension, "Image"},
            {is_video_extension, "Video"},
            {is_audio_extension, "Audio"},
            {is_disk_image, "Disk Image"},
        }};

        // Names for everything that is neither a regular file nor a directory.
        // None of these are ever opened: a FIFO blocks until a writer shows up.
        constexpr std::array<std::pair<FileType, const char*>, 4> kSpecialTypes = {{
            {FileType::fifo, "FIFO"},
            {FileType::socket, "Socket"},
            {FileType::character, "Character Device"},
            {FileType::block, "Block Device"},
        }};

        std::string special_type(FileType type) {
            for (const auto& [kind, name] : kSpecialTypes) {
                if (kind == type) {
                    return name;
                }
            }
            return "Other";
        }

        std::string regular_file_type(const Path& path) {
            for (const auto& entry : kExtensionClasses) {
                if (entry.matches(path)) {
                    return entry.type;
                }
            }
            return is_text_file(path) ? "Text" : "Binary";
        }

        void hash_within_limit(const Path& path, uintmax_t hash_limit, EvidenceReport& report) {
            if (!report.size_bytes) {
                return;
            }
            if (*report.size_bytes > hash_limit) {
                report.sha256_skipped_above = hash_limit;
                return;
            }
            report.sha256 = compute_sha256(path);
            if (!report.sha256) {
                report.warnings.push_back("SHA-256 digest failed: evidence could not be read to the end.");
            }
        }

        void inspect_media(const Path& path, EvidenceReport& report) {
            if (report.type == "Image") {
                report.resolution = image_resolution(path);
            } else if (report.type == "Video") {
                report.resolution = media_resolution(path);
            }
            if ((report.type == "Image" || report.type == "Video") && !report.resolution) {
                report.warnings.push_back(report.type + " evidence has no readable resolution.");
            }

            if (report.type == "Video" || report.type == "Audio") {
                report.duration = media_duration(path);
                if (!report.duration) {
                    report.warnings.push_back(report.type + " evidence has no readable duration.");
                }
            }
        }

        void inspect_regular_file(const Path& path, uintmax_t hash_limit, EvidenceReport& report) {
            report.type = regular_file_type(path);

            std::error_code size_ec;
            const uintmax_t size = std::filesystem::file_size(path, size_ec);
            if (size_ec) {
                report.warnings.push_back("Evidence size unavailable: " + size_ec.message());
            } else {
                report.size_bytes = size;
                report.size_human = format_size(size);
            }

            hash_within_limit(path, hash_limit, report);
            inspect_media(path, report);
        }

        void count_directory_entries(const Path& path, EvidenceReport& report) {
            std::error_code iterator_error;
            std::filesystem::directory_iterator it(
                path, std::filesystem::directory_options::skip_permission_denied, iterator_error);
            if (iterator_error) {
                report.warnings.push_back("Evidence directory not listable: " + iterator_error.message());
                return;
            }

            std::size_t entries = 0;
            const std::filesystem::directory_iterator end;
            while (it != end) {
                ++entries;
                it.increment(iterator_error);
                if (iterator_error) {
                    report.warnings.push_back("Evidence directory listing stopped early: " + iterator_error.message());
                    break;
                }
            }
            report.entry_count = entries;
        }
    }

    EvidenceReport inspect_evidence(const Path& path, uintmax_t hash_limit) {
        EvidenceReport report;
        report.path = path;

        std::error_code status_error;
        const auto status = std::filesystem::status(path, status_error);
        if (status_error || !std::filesystem::exists(status)) {
            report.error = status_error ? status_error.message()
                                        : std::make_error_code(std::errc::no_such_file_or_directory).message();
            return report;
        }

        report.exists = true;
        report.permissions = format_permissions(status.permissions());

        switch (status.type()) {
            case FileType::regular:
                inspect_regular_file(path, hash_limit, report);
                break;
            case FileType::directory:
                report.type = "Directory";
                count_directory_entries(path, report);
                break;
            default:
                report.type = special_type(status.type());
                break;
        }

        return report;
    }
}
