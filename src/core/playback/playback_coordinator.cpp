#include "playback_coordinator.h"
#include "assert_handler.h"

Q_LOGGING_CATEGORY(reelplayCoordinator, "reelplay.playback.coordinator")

PlaybackCoordinator::PlaybackCoordinator(QObject* parent)
    : PlaybackCoordinator(rmp::MediaProbe::CreateDefault(),
                          PlayerOwner::defaultFactory(),
                          ReelPlay::PlaybackSettings::load(),
                          parent)
{
}

PlaybackCoordinator::PlaybackCoordinator(std::shared_ptr<rmp::MediaProbe> probe,
                                         PlayerOwner::PlayerFactory playerFactory,
                                         ReelPlay::PlaybackSettings settings,
                                         QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_validation(std::move(probe))
    , m_owner(std::move(playerFactory))
{
}

PlaybackCoordinator::~PlaybackCoordinator()
{
    // No signals from the destructor: silence the attempt and release quietly
    ++m_attempt;
    m_readyHandler = nullptr;
    m_failureHandler = nullptr;
    m_watchdog.cancel();
    cancelValidation();
    m_owner.stop();
    m_player = nullptr;
    m_validation.waitForIdle();
}

void PlaybackCoordinator::prepare(const rmp::ResourceLocator& locator,
                                  ReadyHandler onReady,
                                  FailureHandler onFailure)
{
    prepare(locator, m_settings.autoPlay, m_settings.loadTimeout,
            std::move(onReady), std::move(onFailure));
}

void PlaybackCoordinator::prepare(const rmp::ResourceLocator& locator,
                                  bool autoPlay,
                                  std::chrono::milliseconds timeout,
                                  ReadyHandler onReady,
                                  FailureHandler onFailure)
{
    teardown();

    const quint64 attempt = ++m_attempt;
    m_autoPlay = autoPlay;
    m_readyHandler = std::move(onReady);
    m_failureHandler = std::move(onFailure);

    qCInfo(reelplayCoordinator, "Preparing %s (attempt %llu, timeout %lld ms, autoplay %s)",
           locator.path().c_str(), static_cast<unsigned long long>(attempt),
           static_cast<long long>(timeout.count()), autoPlay ? "on" : "off");

    setState(LoadState::loading());

    m_watchdog.start(timeout, [this, attempt]() { onWatchdogFired(attempt); });
    m_validationToken = m_validation.validate(
        locator, rmp::deadline_after(timeout), this,
        [this, attempt](rmp::Result<rmp::ValidatedHandle> result) {
            onValidationFinished(attempt, std::move(result));
        });
}

void PlaybackCoordinator::teardown()
{
    // Anything still queued for the previous attempt becomes stale
    ++m_attempt;
    m_readyHandler = nullptr;
    m_failureHandler = nullptr;
    releaseResources();
    setState(LoadState::idle());
}

void PlaybackCoordinator::onValidationFinished(quint64 attempt,
                                               rmp::Result<rmp::ValidatedHandle> result)
{
    if (attempt != m_attempt || !m_state.isLoading()) {
        return;
    }

    m_watchdog.cancel();
    m_validationToken.reset();

    if (result.is_error()) {
        qCWarning(reelplayCoordinator, "Validation failed (%s): %s",
                  rmp::error_code_to_string(result.error().code),
                  result.error().message.c_str());
        fail(result.error());
        return;
    }

    qCDebug(reelplayCoordinator, "Validated %s, starting player",
            result.value().locator().path().c_str());
    m_owner.start(std::move(result.value()), m_autoPlay,
                  [this, attempt]() { onPlayerReady(attempt); },
                  [this, attempt](const rmp::Error& error) { onPlayerFailed(attempt, error); });
}

void PlaybackCoordinator::onWatchdogFired(quint64 attempt)
{
    if (attempt != m_attempt || !m_state.isLoading()) {
        return;
    }

    qCWarning(reelplayCoordinator, "Attempt %llu timed out",
              static_cast<unsigned long long>(attempt));
    fail(rmp::Error::timeout("Resource did not become ready before the deadline"));
}

void PlaybackCoordinator::onPlayerReady(quint64 attempt)
{
    if (attempt != m_attempt || !m_state.isLoading()) {
        return;
    }

    setPlayer(m_owner.player());
    setState(LoadState::ready());

    ReadyHandler onReady = std::move(m_readyHandler);
    m_readyHandler = nullptr;
    m_failureHandler = nullptr;
    if (onReady) {
        onReady();
    }
}

void PlaybackCoordinator::onPlayerFailed(quint64 attempt, const rmp::Error& error)
{
    if (attempt != m_attempt) {
        return;
    }

    if (m_state.isReady()) {
        // The attempt already reported Ready; publish the fault without a second callback
        qCWarning(reelplayCoordinator, "Playback fault after ready: %s", error.message.c_str());
    }
    fail(error);
}

void PlaybackCoordinator::fail(const rmp::Error& error)
{
    releaseResources();
    setState(LoadState::failed(error));

    FailureHandler onFailure = std::move(m_failureHandler);
    m_failureHandler = nullptr;
    m_readyHandler = nullptr;
    if (onFailure) {
        onFailure(error);
    }
}

void PlaybackCoordinator::releaseResources()
{
    m_watchdog.cancel();
    cancelValidation();
    if (m_player) {
        m_player->pause();
    }
    m_owner.stop();
    setPlayer(nullptr);
}

void PlaybackCoordinator::cancelValidation()
{
    if (m_validationToken) {
        m_validationToken->cancel();
        m_validationToken.reset();
    }
}

void PlaybackCoordinator::setState(const LoadState& state)
{
    if (m_state == state) {
        return;
    }

    qCDebug(reelplayCoordinator, "%s -> %s",
            qPrintable(m_state.toString()), qPrintable(state.toString()));
    m_state = state;
    checkInvariants();
    emit stateChanged(m_state);
}

void PlaybackCoordinator::setPlayer(PlayerResource* player)
{
    if (m_player == player) {
        return;
    }
    m_player = player;
    emit playerChanged(m_player);
}

void PlaybackCoordinator::checkInvariants() const
{
    switch (m_state.kind) {
    case LoadState::Ready:
        REELPLAY_ASSERT(m_owner.hasSession() && m_player == m_owner.player(),
                        "Ready requires exactly one live playback session");
        break;
    case LoadState::Idle:
    case LoadState::Failed:
        REELPLAY_ASSERT(!m_owner.hasSession() && !m_player,
                        "Idle/Failed must not hold a playback session");
        REELPLAY_ASSERT(!m_watchdog.isArmed(), "Idle/Failed must not hold an armed watchdog");
        break;
    case LoadState::Loading:
        break;
    }
}
