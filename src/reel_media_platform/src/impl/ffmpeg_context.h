#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/display.h>
}

#include <reel_media_platform/rmp_errors.h>
#include <reel_media_platform/rmp_math_guards.h>
#include <reel_media_platform/rmp_media_probe.h>
#include <string>
#include <vector>

namespace rmp {
namespace impl {

// Convert FFmpeg error code to RMP Error
Error ffmpeg_error(int errnum, const std::string& context);

// FFmpeg format context wrapper (probe only, no decoding)
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Move semantics
    FFmpegFormatContext(FFmpegFormatContext&& other) noexcept;
    FFmpegFormatContext& operator=(FFmpegFormatContext&& other) noexcept;

    // Open a file and read stream info.
    // should_interrupt is polled by FFmpeg during blocking I/O and must
    // outlive this context.
    Result<void> open(const std::string& path, const InterruptCheck* should_interrupt);

    AVFormatContext* get() const { return m_fmt_ctx; }

    // True if any stream has a decoder available
    bool has_decodable_stream() const;

    // Container duration, falling back to the longest video stream; NaN if unknown
    double duration_seconds() const;

    // All video streams except attached cover pictures
    std::vector<VideoTrackInfo> video_tracks() const;

    bool has_audio_stream() const;

private:
    AVFormatContext* m_fmt_ctx = nullptr;
};

// Orientation from AV_PKT_DATA_DISPLAYMATRIX side data (identity if absent)
Transform2D stream_transform(const AVStream* stream);

// Rotation snapped to 0, 90, 180, 270
int stream_rotation(const AVStream* stream);

} // namespace impl
} // namespace rmp
