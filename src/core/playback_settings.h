#pragma once

#include <chrono>

class QSettings;

namespace ReelPlay {

// Playback defaults shared by every prepare() that does not pass its own.
// Sources, lowest precedence first: built-in defaults, QSettings, environment.
struct PlaybackSettings {
    std::chrono::milliseconds loadTimeout{8000};
    bool autoPlay = false;

    // Application QSettings plus REELPLAY_LOAD_TIMEOUT_MS / REELPLAY_AUTOPLAY
    static PlaybackSettings load();

    // Apply the playback/ group of an explicit store, then the environment
    static PlaybackSettings load(QSettings& store);

    // Overlay REELPLAY_* environment variables onto these values
    void applyEnvironment();
};

}  // namespace ReelPlay
