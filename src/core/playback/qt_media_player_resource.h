#pragma once

#include "player_resource.h"

#include <QLoggingCategory>
#include <QMediaPlayer>
#include <QUrl>

#include <reel_media_platform/rmp_validator.h>

Q_DECLARE_LOGGING_CATEGORY(reelplayPlayer)

class QAudioOutput;

/**
 * PlayerResource backed by QtMultimedia
 *
 * LoadedMedia/BufferingMedia/BufferedMedia while loading -> Ready
 * InvalidMedia or an error while loading                -> Failed
 * StalledMedia, InvalidMedia or an error after Ready    -> playbackFailed
 *
 * The source is handed to QMediaPlayer on the next event loop pass.
 */
class QtMediaPlayerResource : public PlayerResource
{
    Q_OBJECT

public:
    explicit QtMediaPlayerResource(const rmp::ValidatedHandle& handle, QObject* parent = nullptr);
    ~QtMediaPlayerResource() override;

    Status status() const override { return m_status; }
    QString errorString() const override;

    void play() override;
    void pause() override;
    bool isPlaying() const override;

    void setVideoOutput(QObject* output) override;

    QMediaPlayer* mediaPlayer() const { return m_player; }

private slots:
    void onMediaStatusChanged(QMediaPlayer::MediaStatus mediaStatus);
    void onErrorOccurred(QMediaPlayer::Error error, const QString& errorString);

private:
    void markFailed(const QString& message);
    void reportPlaybackFault(const QString& message);

    QMediaPlayer* m_player = nullptr;
    QAudioOutput* m_audioOutput = nullptr;
    QUrl m_source;
    Status m_status = Status::Loading;
    QString m_errorString;
};
