#include <reel_media_platform/rmp_validator.h>
#include "impl/log.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace rmp {

Validator::Validator(std::shared_ptr<MediaProbe> probe)
    : m_probe(std::move(probe)) {
    if (!m_probe) {
        throw std::invalid_argument("Validator requires a probe");
    }
}

Size2D Validator::DisplaySize(const VideoTrackInfo& track) {
    Size2D natural{static_cast<double>(track.natural_width),
                   static_cast<double>(track.natural_height)};
    Size2D transformed = track.transform.apply(natural);
    return safe_size(std::max(1.0, std::abs(finite_or_zero(transformed.width))),
                     std::max(1.0, std::abs(finite_or_zero(transformed.height))),
                     Size2D{1.0, 1.0});
}

Result<ValidatedHandle> Validator::Validate(const ResourceLocator& locator,
                                            Deadline deadline,
                                            const CancelToken& cancel) const {
    const std::string& path = locator.path();

    // Cancel wins over deadline: a superseded run must stay silent
    auto interrupted = [&]() -> Result<void> {
        if (cancel.is_cancelled()) {
            return Error::cancelled();
        }
        if (deadline_passed(deadline)) {
            return Error::timeout("Validation deadline passed: " + path);
        }
        return Result<void>();
    };

    // 1. Existence
    if (locator.empty() || !m_probe->Exists(path)) {
        return Error::missing_resource(path);
    }

    auto early = interrupted();
    if (early.is_error()) {
        return early.error();
    }

    InterruptCheck should_interrupt = [&cancel, deadline]() {
        return cancel.is_cancelled() || deadline_passed(deadline);
    };
    auto probe_result = m_probe->Probe(path, should_interrupt);
    if (probe_result.is_error()) {
        if (probe_result.error().is_cancelled()) {
            // Probe abandoned; report why
            auto why = interrupted();
            return why.is_error() ? why.error() : Error::cancelled();
        }
        return probe_result.error();
    }
    const ProbeReport& report = probe_result.value();

    // 2. Playability
    if (!report.playable) {
        return Error::not_playable("Container has no decodable stream: " + path);
    }

    // 3. Duration
    if (!std::isfinite(report.duration_seconds) ||
        report.duration_seconds <= MIN_PLAYABLE_DURATION_SECONDS ||
        report.duration_seconds >= MAX_PLAYABLE_DURATION_SECONDS) {
        char detail[64];
        std::snprintf(detail, sizeof(detail), "Duration %.6gs", report.duration_seconds);
        return Error::bad_duration(std::string(detail) + ": " + path);
    }

    // 4. At least one decodable video track
    auto track = std::find_if(report.video_tracks.begin(), report.video_tracks.end(),
                              [](const VideoTrackInfo& t) { return t.decodable; });
    if (track == report.video_tracks.end()) {
        return Error::no_tracks("No decodable video track: " + path);
    }

    // Results of a cancelled run are never published
    auto late = interrupted();
    if (late.is_error()) {
        return late.error();
    }

    ValidatedHandle handle;
    handle.m_locator = locator;
    handle.m_duration_us = seconds_to_us(report.duration_seconds);
    handle.m_natural_size = Size2D{static_cast<double>(track->natural_width),
                                   static_cast<double>(track->natural_height)};
    handle.m_display_size = DisplaySize(*track);
    handle.m_rotation = track->rotation;
    handle.m_video_stream_index = track->index;
    handle.m_has_audio = report.has_audio;

    RMP_LOG_DEBUG("validated %s: %.3fs display=%.0fx%.0f rotation=%d",
                  path.c_str(), report.duration_seconds,
                  handle.m_display_size.width, handle.m_display_size.height,
                  handle.m_rotation);
    return handle;
}

} // namespace rmp
