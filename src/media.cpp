#include <array>
#include <memory>
#include <algorithm>
#include <string_view>
#include "sandbox_probe/media.hpp"
#include "sandbox_probe/utils.hpp"

extern "C" {
    #include <libavutil/avutil.h>
    #include <libavcodec/avcodec.h>
    #include <libavformat/avformat.h>
}

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace sandbox_probe {

    namespace {
        using Path = std::filesystem::path;

        constexpr std::array<std::string_view, 6> kImageExtensions = {
            ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff"};
        constexpr std::array<std::string_view, 5> kVideoExtensions = {
            ".mp4", ".avi", ".mkv", ".mov", ".flv"};
        constexpr std::array<std::string_view, 5> kAudioExtensions = {
            ".mp3", ".wav", ".flac", ".aac", ".ogg"};

        template <std::size_t N>
        bool matches_extension(const Path& path, const std::array<std::string_view, N>& allowed) {
            const std::string lowered = to_lowercase(path.extension().string());
            return std::any_of(allowed.begin(), allowed.end(), [&](std::string_view item) {
                return lowered == item;
            });
        }

        std::string format_version(unsigned version) {
            return std::to_string(AV_VERSION_MAJOR(version)) + "." +
                   std::to_string(AV_VERSION_MINOR(version)) + "." +
                   std::to_string(AV_VERSION_MICRO(version));
        }

        struct FormatContextDeleter {
            void operator()(AVFormatContext* ctx) const noexcept {
                if (!ctx) {
                    return;
                }
                AVFormatContext* to_close = ctx;
                avformat_close_input(&to_close);
            }
        };

        using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;

        FormatContextPtr open_media_file(const Path& path) {
            AVFormatContext* raw = nullptr;
            if (avformat_open_input(&raw, path.c_str(), nullptr, nullptr) != 0) {
                return nullptr;
            }
            FormatContextPtr context(raw);
            if (avformat_find_stream_info(context.get(), nullptr) < 0) {
                return nullptr;
            }
            return context;
        }
    }

    bool is_image_extension(const Path& path) {
        return matches_extension(path, kImageExtensions);
    }

    bool is_video_extension(const Path& path) {
        return matches_extension(path, kVideoExtensions);
    }

    bool is_audio_extension(const Path& path) {
        return matches_extension(path, kAudioExtensions);
    }

    std::vector<LibraryInfo> linked_media_libraries() {
        return {
            {"libavformat", format_version(avformat_version())},
            {"libavcodec", format_version(avcodec_version())},
            {"libavutil", format_version(avutil_version())},
        };
    }

    std::optional<std::string> image_resolution(const Path& path) {
        int width = 0;
        int height = 0;
        int channels = 0;
        if (stbi_info(path.c_str(), &width, &height, &channels) == 0) {
            return std::nullopt;
        }
        return std::to_string(width) + "x" + std::to_string(height);
    }

    std::optional<std::string> media_resolution(const Path& path) {
        auto context = open_media_file(path);
        if (!context) {
            return std::nullopt;
        }

        const int index = av_find_best_stream(context.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (index < 0) {
            return std::nullopt;
        }

        const AVCodecParameters* params = context->streams[index]->codecpar;
        if (params->width <= 0 || params->height <= 0) {
            return std::nullopt;
        }
        return std::to_string(params->width) + "x" + std::to_string(params->height);
    }

    std::optional<std::string> media_duration(const Path& path) {
        auto context = open_media_file(path);
        if (!context) {
            return std::nullopt;
        }

        if (context->duration == AV_NOPTS_VALUE || context->duration <= 0) {
            return std::nullopt;
        }
        return format_duration(context->duration / AV_TIME_BASE);
    }
}
