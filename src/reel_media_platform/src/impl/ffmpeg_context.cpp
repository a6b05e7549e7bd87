#include "ffmpeg_context.h"
#include <cassert>
#include <cmath>
#include <limits>

namespace rmp {
namespace impl {

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    // Map FFmpeg errors to RMP errors
    if (errnum == AVERROR(ENOENT)) {
        return Error::missing_resource(context);
    } else if (errnum == AVERROR_EXIT) {
        return Error::cancelled();
    } else if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL) ||
               errnum == AVERROR_DEMUXER_NOT_FOUND || errnum == AVERROR_PATCHWELCOME ||
               errnum == AVERROR_EOF) {
        return Error::not_playable(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND) {
        return Error::not_playable("No decoder found: " + context);
    }
    return Error::unknown(msg);
}

// Trampoline for AVIOInterruptCB (non-zero aborts the blocking call)
static int interrupt_trampoline(void* opaque) {
    const auto* check = static_cast<const InterruptCheck*>(opaque);
    return (check && *check && (*check)()) ? 1 : 0;
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

FFmpegFormatContext::FFmpegFormatContext(FFmpegFormatContext&& other) noexcept
    : m_fmt_ctx(other.m_fmt_ctx) {
    other.m_fmt_ctx = nullptr;
}

FFmpegFormatContext& FFmpegFormatContext::operator=(FFmpegFormatContext&& other) noexcept {
    if (this != &other) {
        if (m_fmt_ctx) {
            avformat_close_input(&m_fmt_ctx);
        }
        m_fmt_ctx = other.m_fmt_ctx;
        other.m_fmt_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegFormatContext::open(const std::string& path,
                                       const InterruptCheck* should_interrupt) {
    assert(!m_fmt_ctx && "Format context already opened");

    // Context must exist before open so the interrupt callback covers probing
    m_fmt_ctx = avformat_alloc_context();
    if (!m_fmt_ctx) {
        return Error::unknown("Failed to allocate format context");
    }
    m_fmt_ctx->interrupt_callback.callback = interrupt_trampoline;
    m_fmt_ctx->interrupt_callback.opaque = const_cast<InterruptCheck*>(should_interrupt);

    // avformat_open_input frees the context on failure
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        if (ret == AVERROR(ENOENT)) {
            return Error::missing_resource(path);
        }
        return ffmpeg_error(ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void>();
}

bool FFmpegFormatContext::has_decodable_stream() const {
    assert(m_fmt_ctx && "Format context not opened");

    for (unsigned i = 0; i < m_fmt_ctx->nb_streams; ++i) {
        const AVCodecParameters* params = m_fmt_ctx->streams[i]->codecpar;
        if (params->codec_type != AVMEDIA_TYPE_VIDEO && params->codec_type != AVMEDIA_TYPE_AUDIO) {
            continue;
        }
        if (avcodec_find_decoder(params->codec_id)) {
            return true;
        }
    }
    return false;
}

double FFmpegFormatContext::duration_seconds() const {
    assert(m_fmt_ctx && "Format context not opened");

    if (m_fmt_ctx->duration != AV_NOPTS_VALUE) {
        return static_cast<double>(m_fmt_ctx->duration) / AV_TIME_BASE;
    }

    // Fall back to the longest video stream
    double longest = std::numeric_limits<double>::quiet_NaN();
    for (unsigned i = 0; i < m_fmt_ctx->nb_streams; ++i) {
        const AVStream* stream = m_fmt_ctx->streams[i];
        if (stream->codecpar->codec_type != AVMEDIA_TYPE_VIDEO ||
            stream->duration == AV_NOPTS_VALUE) {
            continue;
        }
        double seconds = stream->duration * av_q2d(stream->time_base);
        if (std::isnan(longest) || seconds > longest) {
            longest = seconds;
        }
    }
    return longest;
}

std::vector<VideoTrackInfo> FFmpegFormatContext::video_tracks() const {
    assert(m_fmt_ctx && "Format context not opened");

    std::vector<VideoTrackInfo> tracks;
    for (unsigned i = 0; i < m_fmt_ctx->nb_streams; ++i) {
        const AVStream* stream = m_fmt_ctx->streams[i];
        const AVCodecParameters* params = stream->codecpar;
        if (params->codec_type != AVMEDIA_TYPE_VIDEO) continue;

        // Embedded cover art is not a playable track
        if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;

        VideoTrackInfo info;
        info.index = static_cast<int>(i);
        info.decodable = avcodec_find_decoder(params->codec_id) != nullptr;
        info.natural_width = params->width;
        info.natural_height = params->height;
        info.transform = stream_transform(stream);
        info.rotation = stream_rotation(stream);
        tracks.push_back(info);
    }
    return tracks;
}

bool FFmpegFormatContext::has_audio_stream() const {
    assert(m_fmt_ctx && "Format context not opened");
    return av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;
}

// Display matrix side data (phone footage).
// FFmpeg 7+: side data is in codecpar->coded_side_data
static const int32_t* find_display_matrix(const AVStream* stream) {
    const AVCodecParameters* params = stream->codecpar;
    for (int i = 0; i < params->nb_coded_side_data; i++) {
        const AVPacketSideData* sd = &params->coded_side_data[i];
        if (sd->type == AV_PKT_DATA_DISPLAYMATRIX && sd->size >= sizeof(int32_t) * 9) {
            return reinterpret_cast<const int32_t*>(sd->data);
        }
    }
    return nullptr;
}

Transform2D stream_transform(const AVStream* stream) {
    const int32_t* matrix = find_display_matrix(stream);
    if (!matrix) {
        return Transform2D::identity();
    }
    // Linear part is 16.16 fixed point: [a b u; c d v; x y w]
    constexpr double kFixed = 65536.0;
    return Transform2D{matrix[0] / kFixed, matrix[1] / kFixed,
                       matrix[3] / kFixed, matrix[4] / kFixed};
}

int stream_rotation(const AVStream* stream) {
    const int32_t* matrix = find_display_matrix(stream);
    if (!matrix) {
        return 0;
    }
    double theta = av_display_rotation_get(matrix);
    if (std::isnan(theta)) {
        return 0;
    }
    // Normalize to 0, 90, 180, 270 (FFmpeg returns negative for CW rotation)
    int rot = static_cast<int>(-theta);
    while (rot < 0) rot += 360;
    while (rot >= 360) rot -= 360;
    // Snap to nearest 90 degree increment
    return ((rot + 45) / 90) * 90 % 360;
}

} // namespace impl
} // namespace rmp
