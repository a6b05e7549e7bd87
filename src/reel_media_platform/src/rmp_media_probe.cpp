#include <reel_media_platform/rmp_media_probe.h>
#include "impl/ffmpeg_context.h"
#include "impl/log.h"
#include <filesystem>
#include <mutex>
#include <system_error>

namespace rmp {

namespace {

class FFmpegMediaProbe : public MediaProbe {
public:
    FFmpegMediaProbe() {
        // Probing garbage files makes demuxers noisy on stderr
        static std::once_flag s_ffmpeg_log_init;
        std::call_once(s_ffmpeg_log_init, [] {
            av_log_set_level(AV_LOG_FATAL);
        });
    }

    bool Exists(const std::string& path) const override {
        std::error_code ec;
        bool exists = std::filesystem::is_regular_file(path, ec);
        if (ec) {
            RMP_LOG_DEBUG("exists(%s): %s", path.c_str(), ec.message().c_str());
            return false;
        }
        return exists;
    }

    Result<ProbeReport> Probe(const std::string& path,
                              const InterruptCheck& should_interrupt) const override {
        impl::FFmpegFormatContext fmt_ctx;
        auto open_result = fmt_ctx.open(path, &should_interrupt);
        if (open_result.is_error()) {
            if (!open_result.error().is_cancelled()) {
                RMP_LOG_WARN("probe(%s) failed: %s", path.c_str(),
                             open_result.error().message.c_str());
            }
            return open_result.error();
        }

        ProbeReport report;
        report.playable = fmt_ctx.has_decodable_stream();
        report.duration_seconds = fmt_ctx.duration_seconds();
        report.video_tracks = fmt_ctx.video_tracks();
        report.has_audio = fmt_ctx.has_audio_stream();

        RMP_LOG_DEBUG("probe(%s): playable=%d duration=%.3fs video_tracks=%zu audio=%d",
                      path.c_str(), report.playable ? 1 : 0, report.duration_seconds,
                      report.video_tracks.size(), report.has_audio ? 1 : 0);
        return report;
    }
};

} // namespace

std::shared_ptr<MediaProbe> MediaProbe::CreateDefault() {
    return std::make_shared<FFmpegMediaProbe>();
}

} // namespace rmp
