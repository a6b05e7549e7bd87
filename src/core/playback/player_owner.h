#pragma once

#include "player_resource.h"
#include "scoped_connection.h"

#include <QLoggingCategory>

#include <reel_media_platform/rmp_errors.h>
#include <reel_media_platform/rmp_validator.h>

#include <functional>
#include <memory>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(reelplayOwner)

/**
 * PlayerOwner - exclusive owner of the single live playback session
 *
 * A session is one PlayerResource plus its signal subscriptions.
 * start() always tears the previous session down first, so two sessions
 * never coexist. Per session:
 * - onReady fires at most once, on the first Ready status
 * - onFailure fires at most once, for a load failure or a later playback
 *   fault, and the session is stopped right after
 * - nothing fires after onFailure or after stop()
 *
 * Must be used from a single thread (the coordinator's).
 */
class PlayerOwner
{
public:
    using ReadyHandler = std::function<void()>;
    using FailureHandler = std::function<void(const rmp::Error&)>;
    using PlayerFactory =
        std::function<std::unique_ptr<PlayerResource>(const rmp::ValidatedHandle&)>;

    explicit PlayerOwner(PlayerFactory factory = defaultFactory());
    ~PlayerOwner();

    PlayerOwner(const PlayerOwner&) = delete;
    PlayerOwner& operator=(const PlayerOwner&) = delete;

    void start(rmp::ValidatedHandle handle,
               bool autoPlay,
               ReadyHandler onReady,
               FailureHandler onFailure);

    // Unsubscribe, pause and release the player, drop callbacks. Idempotent.
    void stop();

    bool hasSession() const { return m_session != nullptr; }

    // Live player, or nullptr without a session
    PlayerResource* player() const;

    // QtMultimedia-backed players
    static PlayerFactory defaultFactory();

private:
    // Deletes on the next event loop turn; a player may be released from
    // inside one of its own signals
    struct DeferredDelete {
        void operator()(QObject* object) const {
            if (object) object->deleteLater();
        }
    };

    struct PlaybackSession {
        PlaybackSession(quint64 sessionId, rmp::ValidatedHandle validated, bool play,
                        ReadyHandler ready, FailureHandler failure)
            : id(sessionId), handle(std::move(validated)), autoPlay(play),
              onReady(std::move(ready)), onFailure(std::move(failure)) {}

        quint64 id;
        rmp::ValidatedHandle handle;
        bool autoPlay;
        ReadyHandler onReady;
        FailureHandler onFailure;
        std::unique_ptr<PlayerResource, DeferredDelete> player;
        // Declared after player: disconnected before the player is released
        std::vector<ScopedConnection> subscriptions;
    };

    void handleStatus(quint64 sessionId, PlayerResource::Status status);
    void handlePlaybackFault(quint64 sessionId, const QString& message);
    void fail(quint64 sessionId, const rmp::Error& error);
    bool isCurrent(quint64 sessionId) const;

    PlayerFactory m_factory;
    std::unique_ptr<PlaybackSession> m_session;
    quint64 m_sessionCounter = 0;
};
