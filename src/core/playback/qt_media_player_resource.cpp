#include "qt_media_player_resource.h"

#include <QAudioOutput>

Q_LOGGING_CATEGORY(reelplayPlayer, "reelplay.playback.player")

QtMediaPlayerResource::QtMediaPlayerResource(const rmp::ValidatedHandle& handle, QObject* parent)
    : PlayerResource(parent)
{
    m_player = new QMediaPlayer(this);
    m_audioOutput = new QAudioOutput(this);
    m_player->setAudioOutput(m_audioOutput);

    connect(m_player, &QMediaPlayer::mediaStatusChanged,
            this, &QtMediaPlayerResource::onMediaStatusChanged);
    connect(m_player, &QMediaPlayer::errorOccurred,
            this, &QtMediaPlayerResource::onErrorOccurred);

    const QString path = QString::fromStdString(handle.locator().path());
    qCDebug(reelplayPlayer, "Loading %s (%.3fs, %.0fx%.0f, rotation %d)",
            qPrintable(path), handle.duration_seconds(),
            handle.display_size().width, handle.display_size().height, handle.rotation());
    m_source = QUrl::fromLocalFile(path);

    // Set from the event loop so a backend that rejects the source
    // synchronously still reaches subscribers connected after construction
    QMetaObject::invokeMethod(this, [this]() { m_player->setSource(m_source); },
                              Qt::QueuedConnection);
}

QtMediaPlayerResource::~QtMediaPlayerResource()
{
    // Disconnect first so stopping does not re-enter our slots
    disconnect(m_player, nullptr, this, nullptr);
    m_player->stop();
}

QString QtMediaPlayerResource::errorString() const
{
    if (!m_errorString.isEmpty()) {
        return m_errorString;
    }
    return m_player->errorString();
}

void QtMediaPlayerResource::play()
{
    m_player->play();
}

void QtMediaPlayerResource::pause()
{
    m_player->pause();
}

bool QtMediaPlayerResource::isPlaying() const
{
    return m_player->playbackState() == QMediaPlayer::PlayingState;
}

void QtMediaPlayerResource::setVideoOutput(QObject* output)
{
    m_player->setVideoOutput(output);
}

void QtMediaPlayerResource::onMediaStatusChanged(QMediaPlayer::MediaStatus mediaStatus)
{
    switch (m_status) {
    case Status::Loading:
        switch (mediaStatus) {
        case QMediaPlayer::LoadedMedia:
        case QMediaPlayer::BufferingMedia:
        case QMediaPlayer::BufferedMedia:
            m_status = Status::Ready;
            qCInfo(reelplayPlayer, "Player ready to play");
            emit statusChanged(m_status);
            break;
        case QMediaPlayer::InvalidMedia:
            markFailed(m_player->errorString().isEmpty()
                           ? QStringLiteral("Media could not be loaded")
                           : m_player->errorString());
            break;
        default:
            break;
        }
        break;

    case Status::Ready:
        if (mediaStatus == QMediaPlayer::StalledMedia) {
            reportPlaybackFault(QStringLiteral("Playback stalled"));
        } else if (mediaStatus == QMediaPlayer::InvalidMedia) {
            reportPlaybackFault(m_player->errorString());
        }
        break;

    case Status::Failed:
        break;
    }
}

void QtMediaPlayerResource::onErrorOccurred(QMediaPlayer::Error error, const QString& errorString)
{
    if (error == QMediaPlayer::NoError) {
        return;
    }

    if (m_status == Status::Loading) {
        markFailed(errorString);
    } else if (m_status == Status::Ready) {
        reportPlaybackFault(errorString);
    }
}

void QtMediaPlayerResource::markFailed(const QString& message)
{
    m_status = Status::Failed;
    m_errorString = message;
    qCWarning(reelplayPlayer, "Player failed: %s", qPrintable(message));
    qCWarning(reelplayPlayer, "Media status: %d, player error: %d",
              static_cast<int>(m_player->mediaStatus()), static_cast<int>(m_player->error()));
    emit statusChanged(m_status);
}

void QtMediaPlayerResource::reportPlaybackFault(const QString& message)
{
    m_errorString = message;
    qCWarning(reelplayPlayer, "Failed to play to end: %s", qPrintable(message));
    emit playbackFailed(message);
}
