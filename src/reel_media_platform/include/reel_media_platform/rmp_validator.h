#pragma once

#include "rmp_cancel_token.h"
#include "rmp_errors.h"
#include "rmp_locator.h"
#include "rmp_math_guards.h"
#include "rmp_media_probe.h"
#include "rmp_time.h"
#include <memory>

namespace rmp {

class Validator;

// Proof that a resource passed validation.
// Only Validator can create one; copies are immutable snapshots.
class ValidatedHandle {
public:
    const ResourceLocator& locator() const { return m_locator; }
    TimeUS duration_us() const { return m_duration_us; }
    double duration_seconds() const { return us_to_seconds(m_duration_us); }

    // Coded size of the first decodable video track
    Size2D natural_size() const { return m_natural_size; }

    // Natural size composed with orientation; never zero or NaN
    Size2D display_size() const { return m_display_size; }

    int rotation() const { return m_rotation; }
    int video_stream_index() const { return m_video_stream_index; }
    bool has_audio() const { return m_has_audio; }

private:
    friend class Validator;
    ValidatedHandle() = default;

    ResourceLocator m_locator;
    TimeUS m_duration_us = 0;
    Size2D m_natural_size{0.0, 0.0};
    Size2D m_display_size{1.0, 1.0};
    int m_rotation = 0;
    int m_video_stream_index = -1;
    bool m_has_audio = false;
};

// Structural playability check.
// Checks in order, stopping at the first failure:
//   existence -> playability -> duration -> decodable video track
class Validator {
public:
    explicit Validator(std::shared_ptr<MediaProbe> probe);

    // Blocking; call off the coordinating thread.
    // Returns Cancelled if cancel fired, Timeout if deadline passed first.
    Result<ValidatedHandle> Validate(const ResourceLocator& locator,
                                     Deadline deadline,
                                     const CancelToken& cancel) const;

    // Display geometry with degenerate results coerced to a safe fallback
    static Size2D DisplaySize(const VideoTrackInfo& track);

private:
    std::shared_ptr<MediaProbe> m_probe;
};

} // namespace rmp
