#pragma once

// Scriptable doubles for the media probe and the player resource

#include "core/playback/player_owner.h"
#include "core/playback/player_resource.h"

#include <QPointer>
#include <QString>

#include <reel_media_platform/rmp_media_probe.h>
#include <reel_media_platform/rmp_validator.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// Per-path probe script. Probe() sleeps for `delay` while polling the
// interrupt check, then returns `error` if set, otherwise `report`.
struct FakeMediaEntry {
    bool exists = true;
    rmp::ProbeReport report;
    std::optional<rmp::Error> error;
    std::chrono::milliseconds delay{0};
};

class FakeMediaProbe : public rmp::MediaProbe {
public:
    // One decodable 1920x1080 track, 5 s, playable
    static rmp::ProbeReport goodReport(double durationSeconds = 5.0) {
        rmp::ProbeReport report;
        report.playable = true;
        report.duration_seconds = durationSeconds;
        report.video_tracks.push_back(track(1920, 1080));
        report.has_audio = true;
        return report;
    }

    static rmp::VideoTrackInfo track(int width, int height,
                                     rmp::Transform2D transform = rmp::Transform2D::identity(),
                                     int rotation = 0, bool decodable = true, int index = 0) {
        return rmp::VideoTrackInfo{index, decodable, width, height, transform, rotation};
    }

    void set(const std::string& path, FakeMediaEntry entry) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries[path] = std::move(entry);
    }

    void setGood(const std::string& path, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        FakeMediaEntry entry;
        entry.report = goodReport();
        entry.delay = delay;
        set(path, entry);
    }

    int probeCount() const { return m_probeCount.load(); }
    int interruptedCount() const { return m_interrupted.load(); }

    bool Exists(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(path);
        return it != m_entries.end() && it->second.exists;
    }

    rmp::Result<rmp::ProbeReport> Probe(const std::string& path,
                                        const rmp::InterruptCheck& should_interrupt) const override {
        ++m_probeCount;
        FakeMediaEntry entry;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(path);
            if (it == m_entries.end()) {
                return rmp::Error::missing_resource(path);
            }
            entry = it->second;
        }

        const auto until = std::chrono::steady_clock::now() + entry.delay;
        while (std::chrono::steady_clock::now() < until) {
            if (should_interrupt && should_interrupt()) {
                ++m_interrupted;
                return rmp::Error::cancelled();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        if (entry.error) {
            return *entry.error;
        }
        return entry.report;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, FakeMediaEntry> m_entries;
    mutable std::atomic<int> m_probeCount{0};
    mutable std::atomic<int> m_interrupted{0};
};

// Player whose status is driven by the test
class FakePlayerResource : public PlayerResource
{
    Q_OBJECT

public:
    explicit FakePlayerResource(Status initial = Status::Loading, QObject* parent = nullptr)
        : PlayerResource(parent), m_status(initial) {}

    Status status() const override { return m_status; }
    QString errorString() const override { return m_errorString; }

    void play() override { m_playing = true; ++m_playCalls; }
    void pause() override { m_playing = false; ++m_pauseCalls; }
    bool isPlaying() const override { return m_playing; }

    void setVideoOutput(QObject* output) override { m_output = output; }

    void becomeReady() {
        m_status = Status::Ready;
        emit statusChanged(m_status);
    }

    void fail(const QString& message) {
        m_status = Status::Failed;
        m_errorString = message;
        emit statusChanged(m_status);
    }

    void faultDuringPlayback(const QString& message) {
        m_errorString = message;
        emit playbackFailed(message);
    }

    int playCalls() const { return m_playCalls; }
    int pauseCalls() const { return m_pauseCalls; }
    QObject* videoOutput() const { return m_output; }

private:
    Status m_status;
    QString m_errorString;
    bool m_playing = false;
    int m_playCalls = 0;
    int m_pauseCalls = 0;
    QObject* m_output = nullptr;
};

// Factory that records every player it creates.
// Entries are QPointers: owners release players with deleteLater().
class FakePlayerFactory
{
public:
    PlayerResource::Status initialStatus = PlayerResource::Status::Loading;
    bool returnNull = false;

    PlayerOwner::PlayerFactory factory() {
        return [this](const rmp::ValidatedHandle& handle) -> std::unique_ptr<PlayerResource> {
            m_handles.push_back(handle.locator().path());
            if (returnNull) {
                return nullptr;
            }
            auto player = std::make_unique<FakePlayerResource>(initialStatus);
            m_players.push_back(player.get());
            return player;
        };
    }

    int created() const { return static_cast<int>(m_handles.size()); }
    FakePlayerResource* last() const { return m_players.empty() ? nullptr : m_players.back().data(); }
    FakePlayerResource* at(int i) const { return m_players.at(i).data(); }
    const std::vector<std::string>& handlePaths() const { return m_handles; }

private:
    std::vector<QPointer<FakePlayerResource>> m_players;
    std::vector<std::string> m_handles;
};

// Validate synchronously through a fake probe to obtain a real handle
inline rmp::ValidatedHandle makeValidatedHandle(const std::string& path = "/media/clip.mp4")
{
    auto probe = std::make_shared<FakeMediaProbe>();
    probe->setGood(path);
    rmp::Validator validator(probe);
    return validator.Validate(rmp::ResourceLocator(path),
                              rmp::deadline_after(std::chrono::seconds(5)),
                              rmp::CancelToken()).unwrap();
}
