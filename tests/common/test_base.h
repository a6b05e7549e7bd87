#pragma once

#include <QTest>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QLoggingCategory>
#include <QTemporaryDir>
#include <QStandardPaths>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(reelplayTests)

/**
 * Base class for ReelPlay tests providing common setup and utilities
 * Isolated temp directory, settings sandbox, slow-test logging, fixture lookup
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    std::unique_ptr<QTemporaryDir> m_testDataDir;
    QElapsedTimer m_timer;

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    virtual void initTestCase() {
        QLoggingCategory::setFilterRules("reelplay.*=true\nreelplay.*.debug=false");
        qCInfo(reelplayTests, "Initializing test case: %s", metaObject()->className());

        m_testDataDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_testDataDir->isValid());

        // Keep QSettings and app data out of the user's profile
        QStandardPaths::setTestModeEnabled(true);
    }

    virtual void cleanupTestCase() {
        qCInfo(reelplayTests, "Cleaning up test case: %s", metaObject()->className());
        m_testDataDir.reset();
    }

    virtual void init() {
        m_timer.start();
    }

    virtual void cleanup() {
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > 1000) {
            qCWarning(reelplayTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    /**
     * Path of a real video for tests that need FFmpeg/QtMultimedia end to end.
     * REELPLAY_TEST_MEDIA wins, then the first video under fixtures/.
     * Empty when none is available; callers QSKIP.
     */
    static QString findFixtureVideo() {
        const QString fromEnv = qEnvironmentVariable("REELPLAY_TEST_MEDIA");
        if (!fromEnv.isEmpty() && QFile::exists(fromEnv)) {
            return fromEnv;
        }

        const QStringList fixtureDirs = {
            QDir::currentPath() + "/fixtures",
            QDir::currentPath() + "/../fixtures",
            QDir::currentPath() + "/tests/fixtures",
        };
        for (const QString& path : fixtureDirs) {
            QDir dir(path);
            if (!dir.exists()) continue;
            const QStringList videos = dir.entryList(
                QStringList() << "*.mp4" << "*.mov" << "*.m4v" << "*.mkv", QDir::Files);
            if (!videos.isEmpty()) {
                return dir.absoluteFilePath(videos.first());
            }
        }
        return QString();
    }

    // Write bytes to a file in the test data dir and return its path
    QString writeTestFile(const QString& name, const QByteArray& contents) {
        const QString path = m_testDataDir->filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(contents);
        return path;
    }
};
