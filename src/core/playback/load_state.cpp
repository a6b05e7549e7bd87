#include "load_state.h"

LoadState LoadState::failed(const rmp::Error& error)
{
    return LoadState{Failed, error.code, describeLoadFailure(error)};
}

QString LoadState::toString() const
{
    switch (kind) {
    case Idle:
        return QStringLiteral("Idle");
    case Loading:
        return QStringLiteral("Loading");
    case Ready:
        return QStringLiteral("Ready");
    case Failed:
        return QStringLiteral("Failed(%1)").arg(message);
    }
    return QStringLiteral("Unknown");
}

QString describeLoadFailure(const rmp::Error& error)
{
    switch (error.code) {
    case rmp::ErrorCode::MissingResource:
        return QStringLiteral("resource not found");
    case rmp::ErrorCode::NotPlayable:
        return QStringLiteral("not playable on this device");
    case rmp::ErrorCode::NoTracks:
        return QStringLiteral("no playable tracks");
    case rmp::ErrorCode::BadDuration:
        return QStringLiteral("invalid duration");
    case rmp::ErrorCode::Timeout:
        return QStringLiteral("did not become ready before the deadline");
    case rmp::ErrorCode::Ok:
    case rmp::ErrorCode::Cancelled:
    case rmp::ErrorCode::Unknown:
        break;
    }
    return QString::fromStdString(error.message);
}
