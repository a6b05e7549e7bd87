#include "player_owner.h"
#include "qt_media_player_resource.h"

Q_LOGGING_CATEGORY(reelplayOwner, "reelplay.playback.owner")

PlayerOwner::PlayerOwner(PlayerFactory factory)
    : m_factory(std::move(factory))
{
    Q_ASSERT(m_factory);
}

PlayerOwner::~PlayerOwner()
{
    stop();
}

PlayerOwner::PlayerFactory PlayerOwner::defaultFactory()
{
    return [](const rmp::ValidatedHandle& handle) -> std::unique_ptr<PlayerResource> {
        return std::make_unique<QtMediaPlayerResource>(handle);
    };
}

PlayerResource* PlayerOwner::player() const
{
    return m_session ? m_session->player.get() : nullptr;
}

bool PlayerOwner::isCurrent(quint64 sessionId) const
{
    return m_session && m_session->id == sessionId;
}

void PlayerOwner::start(rmp::ValidatedHandle handle,
                        bool autoPlay,
                        ReadyHandler onReady,
                        FailureHandler onFailure)
{
    stop();

    const quint64 sessionId = ++m_sessionCounter;
    m_session = std::make_unique<PlaybackSession>(sessionId, std::move(handle), autoPlay,
                                                  std::move(onReady), std::move(onFailure));

    std::unique_ptr<PlayerResource> created = m_factory(m_session->handle);
    if (!created) {
        fail(sessionId, rmp::Error::unknown("Failed to create player for " +
                                            m_session->handle.locator().path()));
        return;
    }
    m_session->player.reset(created.release());

    PlayerResource* player = m_session->player.get();
    qCDebug(reelplayOwner, "Session %llu started for %s",
            static_cast<unsigned long long>(sessionId),
            m_session->handle.locator().path().c_str());

    m_session->subscriptions.emplace_back(QObject::connect(
        player, &PlayerResource::statusChanged, player,
        [this, sessionId](PlayerResource::Status status) { handleStatus(sessionId, status); }));
    m_session->subscriptions.emplace_back(QObject::connect(
        player, &PlayerResource::playbackFailed, player,
        [this, sessionId](const QString& message) { handlePlaybackFault(sessionId, message); }));

    // Report a status the player reached before we subscribed
    handleStatus(sessionId, player->status());
}

void PlayerOwner::stop()
{
    if (!m_session) {
        return;
    }

    // Detach the slot before any teardown so re-entrant calls see no session
    std::unique_ptr<PlaybackSession> session = std::move(m_session);
    session->subscriptions.clear();
    session->onReady = nullptr;
    session->onFailure = nullptr;
    if (session->player) {
        session->player->pause();
    }

    qCDebug(reelplayOwner, "Session %llu stopped", static_cast<unsigned long long>(session->id));
}

void PlayerOwner::handleStatus(quint64 sessionId, PlayerResource::Status status)
{
    if (!isCurrent(sessionId)) {
        return;
    }

    switch (status) {
    case PlayerResource::Status::Loading:
        break;

    case PlayerResource::Status::Ready: {
        if (!m_session->onReady) {
            return;
        }
        if (m_session->autoPlay) {
            m_session->player->play();
        }
        ReadyHandler onReady = std::move(m_session->onReady);
        m_session->onReady = nullptr;
        qCInfo(reelplayOwner, "Session %llu ready", static_cast<unsigned long long>(sessionId));
        onReady();
        break;
    }

    case PlayerResource::Status::Failed: {
        QString message = m_session->player->errorString();
        if (message.isEmpty()) {
            message = QStringLiteral("Player failed");
        }
        fail(sessionId, rmp::Error::unknown(message.toStdString()));
        break;
    }
    }
}

void PlayerOwner::handlePlaybackFault(quint64 sessionId, const QString& message)
{
    if (!isCurrent(sessionId)) {
        return;
    }
    fail(sessionId, rmp::Error::unknown(message.isEmpty() ? std::string("Playback failed")
                                                          : message.toStdString()));
}

void PlayerOwner::fail(quint64 sessionId, const rmp::Error& error)
{
    if (!isCurrent(sessionId)) {
        return;
    }

    // First terminal event wins: clear both callbacks before invoking
    FailureHandler onFailure = std::move(m_session->onFailure);
    m_session->onFailure = nullptr;
    m_session->onReady = nullptr;

    qCWarning(reelplayOwner, "Session %llu failed: %s",
              static_cast<unsigned long long>(sessionId), error.message.c_str());

    if (onFailure) {
        onFailure(error);
    }

    // The handler may already have stopped or replaced the session
    if (isCurrent(sessionId)) {
        stop();
    }
}
