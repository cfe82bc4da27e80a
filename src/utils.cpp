#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <algorithm>
#include "sandbox_probe/utils.hpp"

namespace sandbox_probe {

    namespace {
        namespace fs = std::filesystem;

        constexpr std::size_t kTextSniffLength = 512;
        constexpr double kBinaryRatioLimit = 0.3;
        constexpr std::array<const char*, 5> kSizeUnits = {"B", "KB", "MB", "GB", "TB"};

        constexpr std::array<std::pair<fs::perms, char>, 9> kPermissionBits = {{
            {fs::perms::owner_read, 'r'},
            {fs::perms::owner_write, 'w'},
            {fs::perms::owner_exec, 'x'},
            {fs::perms::group_read, 'r'},
            {fs::perms::group_write, 'w'},
            {fs::perms::group_exec, 'x'},
            {fs::perms::others_read, 'r'},
            {fs::perms::others_write, 'w'},
            {fs::perms::others_exec, 'x'},
        }};
    }

    std::string format_size(uintmax_t size) {
        std::size_t unit = 0;
        double value = static_cast<double>(size);
        while (value >= 1024.0 && unit + 1 < kSizeUnits.size()) {
            value /= 1024.0;
            ++unit;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << ' ' << kSizeUnits[unit];
        return oss.str();
    }

    std::string format_permissions(fs::perms perms) {
        std::string symbols(kPermissionBits.size(), '-');
        for (std::size_t i = 0; i < kPermissionBits.size(); ++i) {
            if ((perms & kPermissionBits[i].first) != fs::perms::none) {
                symbols[i] = kPermissionBits[i].second;
            }
        }
        return symbols;
    }

    std::string format_utc_time(std::time_t value) {
        std::tm utc {};
        if (gmtime_r(&value, &utc) == nullptr) {
            return "unknown";
        }

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string format_duration(long long total_seconds) {
        if (total_seconds < 0) {
            total_seconds = 0;
        }
        const long long hours = total_seconds / 3600;
        const long long minutes = (total_seconds % 3600) / 60;
        const long long seconds = total_seconds % 60;

        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(2) << hours << ':'
            << std::setw(2) << minutes << ':' << std::setw(2) << seconds;
        return oss.str();
    }

    std::string to_lowercase(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool is_text_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }

        std::array<char, kTextSniffLength> sample {};
        file.read(sample.data(), static_cast<std::streamsize>(sample.size()));
        const auto length = static_cast<std::size_t>(file.gcount());
        if (length == 0) {
            return true;
        }

        const auto non_text = std::count_if(sample.begin(), sample.begin() + length, [](char ch) {
            const auto byte = static_cast<unsigned char>(ch);
            return byte == 0 || (!std::isprint(byte) && !std::isspace(byte) && byte < 0x80);
        });
        return static_cast<double>(non_text) / static_cast<double>(length) < kBinaryRatioLimit;
    }
}
