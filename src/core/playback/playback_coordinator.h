#pragma once

#include "asset_validation_runner.h"
#include "load_state.h"
#include "load_watchdog.h"
#include "player_owner.h"
#include "core/playback_settings.h"

#include <QLoggingCategory>
#include <QObject>
#include <QString>

#include <reel_media_platform/rmp_cancel_token.h>
#include <reel_media_platform/rmp_media_probe.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

Q_DECLARE_LOGGING_CATEGORY(reelplayCoordinator)

/**
 * PlaybackCoordinator - media readiness state machine
 *
 * prepare() validates a resource in the background while a watchdog
 * bounds the wait; a validated resource is handed to the PlayerOwner.
 * The first of {validation result, deadline, player ready, player failure}
 * decides the attempt, and exactly one of onReady/onFailure fires per
 * prepare(). Later events of the same attempt are ignored, and a new
 * prepare() or teardown() silences everything still in flight.
 *
 * Lives on one thread; every state change and callback happens there.
 *
 * Published state: state() with stateChanged(), and player() with
 * playerChanged(). player() is non-null only while Ready.
 */
class PlaybackCoordinator : public QObject
{
    Q_OBJECT

public:
    using ReadyHandler = std::function<void()>;
    using FailureHandler = std::function<void(const rmp::Error&)>;

    explicit PlaybackCoordinator(QObject* parent = nullptr);
    PlaybackCoordinator(std::shared_ptr<rmp::MediaProbe> probe,
                        PlayerOwner::PlayerFactory playerFactory,
                        ReelPlay::PlaybackSettings settings,
                        QObject* parent = nullptr);
    ~PlaybackCoordinator() override;

    void prepare(const rmp::ResourceLocator& locator,
                 bool autoPlay,
                 std::chrono::milliseconds timeout,
                 ReadyHandler onReady = nullptr,
                 FailureHandler onFailure = nullptr);

    // Uses the configured timeout and auto-play default
    void prepare(const rmp::ResourceLocator& locator,
                 ReadyHandler onReady = nullptr,
                 FailureHandler onFailure = nullptr);

    // Cancel everything in flight, release the player, return to Idle.
    // Safe to call at any time, any number of times.
    void teardown();

    const LoadState& state() const { return m_state; }
    PlayerResource* player() const { return m_player; }
    const ReelPlay::PlaybackSettings& settings() const { return m_settings; }

signals:
    void stateChanged(const LoadState& state);
    void playerChanged(PlayerResource* player);

private:
    void onValidationFinished(quint64 attempt, rmp::Result<rmp::ValidatedHandle> result);
    void onWatchdogFired(quint64 attempt);
    void onPlayerReady(quint64 attempt);
    void onPlayerFailed(quint64 attempt, const rmp::Error& error);

    void fail(const rmp::Error& error);
    void releaseResources();
    void cancelValidation();
    void setState(const LoadState& state);
    void setPlayer(PlayerResource* player);
    void checkInvariants() const;

    ReelPlay::PlaybackSettings m_settings;
    AssetValidationRunner m_validation;
    PlayerOwner m_owner;
    LoadWatchdog m_watchdog;

    std::optional<rmp::CancelToken> m_validationToken;
    quint64 m_attempt = 0;
    bool m_autoPlay = false;
    ReadyHandler m_readyHandler;
    FailureHandler m_failureHandler;

    LoadState m_state;
    PlayerResource* m_player = nullptr;
};
