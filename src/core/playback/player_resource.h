#pragma once

#include <QObject>
#include <QString>

/**
 * Playable resource bound to one validated media handle
 *
 * Status moves Loading -> Ready or Loading -> Failed once.
 * Faults after readiness (stalls, decode errors) arrive on playbackFailed.
 */
class PlayerResource : public QObject
{
    Q_OBJECT

public:
    enum class Status {
        Loading,
        Ready,
        Failed
    };

    explicit PlayerResource(QObject* parent = nullptr);
    ~PlayerResource() override;

    virtual Status status() const = 0;
    virtual QString errorString() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool isPlaying() const = 0;

    // Attach a rendering surface (QVideoWidget, QVideoSink, ...)
    virtual void setVideoOutput(QObject* output) = 0;

signals:
    void statusChanged(PlayerResource::Status status);
    void playbackFailed(const QString& message);
};
