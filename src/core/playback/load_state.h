#pragma once

#include <QMetaType>
#include <QString>

#include <reel_media_platform/rmp_errors.h>

/**
 * Coordinator-visible load state
 *
 * Per prepare() call: Idle -> Loading -> {Ready | Failed}.
 * Failed carries the error code and the user-facing message.
 */
struct LoadState
{
    enum Kind {
        Idle,
        Loading,
        Ready,
        Failed
    };

    Kind kind = Idle;
    rmp::ErrorCode reason = rmp::ErrorCode::Ok;
    QString message;

    static LoadState idle() { return LoadState{}; }
    static LoadState loading() { return LoadState{Loading, rmp::ErrorCode::Ok, QString()}; }
    static LoadState ready() { return LoadState{Ready, rmp::ErrorCode::Ok, QString()}; }
    static LoadState failed(const rmp::Error& error);

    bool isIdle() const { return kind == Idle; }
    bool isLoading() const { return kind == Loading; }
    bool isReady() const { return kind == Ready; }
    bool isFailed() const { return kind == Failed; }

    // "Idle", "Loading", "Ready" or "Failed(<message>)"
    QString toString() const;

    bool operator==(const LoadState& other) const {
        if (kind != other.kind) return false;
        if (kind != Failed) return true;
        return reason == other.reason && message == other.message;
    }
    bool operator!=(const LoadState& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(LoadState)

/**
 * User-facing text for a load failure.
 * Unknown errors pass through their native description.
 */
QString describeLoadFailure(const rmp::Error& error);
