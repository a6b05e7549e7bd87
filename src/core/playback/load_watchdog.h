#pragma once

#include <QLoggingCategory>
#include <QTimer>

#include <chrono>
#include <functional>

Q_DECLARE_LOGGING_CATEGORY(reelplayWatchdog)

/**
 * Single-shot deadline timer bound to the constructing thread's event loop
 *
 * onTimeout fires at most once per start(), never after cancel() returns.
 * start() while armed replaces the previous arming.
 */
class LoadWatchdog
{
public:
    LoadWatchdog();
    ~LoadWatchdog();

    LoadWatchdog(const LoadWatchdog&) = delete;
    LoadWatchdog& operator=(const LoadWatchdog&) = delete;

    void start(std::chrono::milliseconds timeout, std::function<void()> onTimeout);
    void cancel();

    bool isArmed() const;

private:
    void fire();

    QTimer m_timer;
    std::function<void()> m_onTimeout;
};
