#pragma once

#include "rmp_errors.h"
#include "rmp_math_guards.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rmp {

// Returns true when blocking probe work should be abandoned
using InterruptCheck = std::function<bool()>;

// Video stream facts as reported by the container
struct VideoTrackInfo {
    int index;                 // stream index within the container
    bool decodable;            // a decoder exists for the codec
    int natural_width;
    int natural_height;
    Transform2D transform;     // orientation from display matrix (identity if absent)
    int rotation;              // 0, 90, 180, 270
};

// Raw structural facts about a resource. No policy is applied here;
// the Validator decides what counts as loadable.
struct ProbeReport {
    bool playable = false;                // container opened and has a decodable stream
    double duration_seconds = 0.0;        // NaN when the container reports none
    std::vector<VideoTrackInfo> video_tracks;
    bool has_audio = false;
};

// Media-resource inspection seam.
// Implementations must be callable from any thread.
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    // Existence check on local storage
    virtual bool Exists(const std::string& path) const = 0;

    // Open the container and report its structure.
    // Returns Error::cancelled() when should_interrupt() turned true mid-probe.
    virtual Result<ProbeReport> Probe(const std::string& path,
                                      const InterruptCheck& should_interrupt) const = 0;

    // FFmpeg-backed probe
    static std::shared_ptr<MediaProbe> CreateDefault();
};

} // namespace rmp
