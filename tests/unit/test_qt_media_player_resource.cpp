// Tests for QtMediaPlayerResource: QMediaPlayer status/error mapping onto
// Loading -> Ready | Failed and post-ready faults

#include <QtTest>
#include <QSignalSpy>

#include "../common/fake_media.h"
#include "../common/test_base.h"
#include "core/playback/qt_media_player_resource.h"

using Status = PlayerResource::Status;

namespace {

// Collects statusChanged arguments without relying on a registered metatype
struct StatusLog {
    QList<Status> statuses;

    void attach(QtMediaPlayerResource* res) {
        QObject::connect(res, &PlayerResource::statusChanged,
                         [this](Status status) { statuses.append(status); });
    }
};

}  // namespace

class TestQtMediaPlayerResource : public TestBase
{
    Q_OBJECT

private:
    // No event loop pass runs between construction and the emitted signals,
    // so the backend never sees the source in these tests
    std::unique_ptr<QtMediaPlayerResource> makeResource() {
        return std::make_unique<QtMediaPlayerResource>(makeValidatedHandle("/media/clip.mp4"));
    }

private slots:
    void test_initial_status_is_loading() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());

        QCOMPARE(res->status(), Status::Loading);
        QVERIFY(log.statuses.isEmpty());
        QVERIFY(!res->isPlaying());
    }

    void test_loaded_statuses_become_ready_data() {
        QTest::addColumn<QMediaPlayer::MediaStatus>("mediaStatus");
        QTest::newRow("loaded") << QMediaPlayer::LoadedMedia;
        QTest::newRow("buffering") << QMediaPlayer::BufferingMedia;
        QTest::newRow("buffered") << QMediaPlayer::BufferedMedia;
    }

    void test_loaded_statuses_become_ready() {
        QFETCH(QMediaPlayer::MediaStatus, mediaStatus);
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->mediaStatusChanged(mediaStatus);
        QCOMPARE(res->status(), Status::Ready);
        QCOMPARE(log.statuses.size(), 1);
        QCOMPARE(log.statuses.front(), Status::Ready);

        // A second readiness report is not a transition
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::BufferedMedia);
        QCOMPARE(log.statuses.size(), 1);
        QCOMPARE(faultSpy.count(), 0);
    }

    void test_intermediate_statuses_ignored() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::NoMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::LoadingMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::StalledMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::EndOfMedia);

        QCOMPARE(res->status(), Status::Loading);
        QVERIFY(log.statuses.isEmpty());
    }

    void test_invalid_media_while_loading_fails() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::InvalidMedia);
        QCOMPARE(res->status(), Status::Failed);
        QCOMPARE(log.statuses.size(), 1);
        QCOMPARE(log.statuses.front(), Status::Failed);
        QCOMPARE(res->errorString(), QString("Media could not be loaded"));
        QCOMPARE(faultSpy.count(), 0);
    }

    void test_error_while_loading_fails() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());

        emit res->mediaPlayer()->errorOccurred(QMediaPlayer::ResourceError, "cannot open file");
        QCOMPARE(res->status(), Status::Failed);
        QCOMPARE(log.statuses.size(), 1);
        QCOMPARE(res->errorString(), QString("cannot open file"));
    }

    void test_no_error_is_ignored() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());

        emit res->mediaPlayer()->errorOccurred(QMediaPlayer::NoError, QString());
        QCOMPARE(res->status(), Status::Loading);
        QVERIFY(log.statuses.isEmpty());
    }

    void test_stall_after_ready_is_fault() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::LoadedMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::StalledMedia);

        QCOMPARE(faultSpy.count(), 1);
        QCOMPARE(faultSpy.takeFirst().at(0).toString(), QString("Playback stalled"));
        QCOMPARE(res->status(), Status::Ready);
        QCOMPARE(log.statuses.size(), 1);
    }

    void test_invalid_media_after_ready_is_fault() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::BufferedMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::InvalidMedia);

        QCOMPARE(faultSpy.count(), 1);
        QCOMPARE(res->status(), Status::Ready);
        QCOMPARE(log.statuses.size(), 1);
    }

    void test_error_after_ready_is_fault() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::LoadedMedia);
        emit res->mediaPlayer()->errorOccurred(QMediaPlayer::FormatError, "decoder lost");

        QCOMPARE(faultSpy.count(), 1);
        QCOMPARE(faultSpy.takeFirst().at(0).toString(), QString("decoder lost"));
        QCOMPARE(res->errorString(), QString("decoder lost"));
        QCOMPARE(log.statuses.size(), 1);
    }

    void test_nothing_emitted_after_failed() {
        auto res = makeResource();
        StatusLog log;
        log.attach(res.get());
        QSignalSpy faultSpy(res.get(), &PlayerResource::playbackFailed);

        emit res->mediaPlayer()->errorOccurred(QMediaPlayer::ResourceError, "cannot open file");
        QCOMPARE(log.statuses.size(), 1);

        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::LoadedMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::StalledMedia);
        emit res->mediaPlayer()->mediaStatusChanged(QMediaPlayer::InvalidMedia);
        emit res->mediaPlayer()->errorOccurred(QMediaPlayer::FormatError, "late error");

        QCOMPARE(res->status(), Status::Failed);
        QCOMPARE(log.statuses.size(), 1);
        QCOMPARE(faultSpy.count(), 0);
        QCOMPARE(res->errorString(), QString("cannot open file"));
    }

    void test_source_set_on_next_event_loop_pass() {
        auto res = makeResource();
        QVERIFY(res->mediaPlayer()->source().isEmpty());

        QCoreApplication::processEvents();
        QCOMPARE(res->mediaPlayer()->source(), QUrl::fromLocalFile("/media/clip.mp4"));
    }

    void test_backend_rejects_missing_file() {
        const QString path = m_testDataDir->filePath("absent.mp4");
        QtMediaPlayerResource res(makeValidatedHandle(path.toStdString()));
        if (!res.mediaPlayer()->isAvailable()) QSKIP("No QtMultimedia backend");

        QList<Status> statuses;
        connect(&res, &PlayerResource::statusChanged,
                [&statuses](Status status) { statuses.append(status); });

        QTRY_COMPARE_WITH_TIMEOUT(res.status(), Status::Failed, 5000);
        QCOMPARE(statuses.size(), 1);
        QVERIFY(!res.errorString().isEmpty());
    }
};

QTEST_MAIN(TestQtMediaPlayerResource)
#include "test_qt_media_player_resource.moc"
