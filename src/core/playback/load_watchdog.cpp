#include "load_watchdog.h"

Q_LOGGING_CATEGORY(reelplayWatchdog, "reelplay.playback.watchdog")

LoadWatchdog::LoadWatchdog()
{
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::PreciseTimer);
    QObject::connect(&m_timer, &QTimer::timeout, &m_timer, [this]() { fire(); });
}

LoadWatchdog::~LoadWatchdog()
{
    cancel();
}

void LoadWatchdog::start(std::chrono::milliseconds timeout, std::function<void()> onTimeout)
{
    cancel();

    m_onTimeout = std::move(onTimeout);
    m_timer.start(timeout);
    qCDebug(reelplayWatchdog, "Armed for %lld ms", static_cast<long long>(timeout.count()));
}

void LoadWatchdog::cancel()
{
    if (m_timer.isActive()) {
        qCDebug(reelplayWatchdog, "Disarmed");
    }
    m_timer.stop();
    m_onTimeout = nullptr;
}

bool LoadWatchdog::isArmed() const
{
    return m_timer.isActive();
}

void LoadWatchdog::fire()
{
    if (!m_onTimeout) {
        return;
    }

    // Clear before invoking: the callback may re-arm this watchdog
    std::function<void()> onTimeout = std::move(m_onTimeout);
    m_onTimeout = nullptr;

    qCInfo(reelplayWatchdog, "Deadline elapsed");
    onTimeout();
}
