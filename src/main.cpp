#include <QApplication>
#include <QStyleFactory>
#include <QLoggingCategory>
#include <QWidget>
#include <QVBoxLayout>
#include <QLabel>
#include <QFileInfo>
#include <QVideoWidget>

#include <cstdio>

#include "assert_handler.h"
#include "core/playback/load_state.h"
#include "core/playback/playback_coordinator.h"

#include <reel_media_platform/rmp_locator.h>

Q_LOGGING_CATEGORY(reelplayMain, "reelplay.main")

int main(int argc, char *argv[])
{
    reelplay_install_abort_handler();

    QApplication app(argc, argv);

    // Application metadata (also scopes QSettings)
    app.setApplicationName("ReelPlay");
    app.setApplicationVersion("1.0.0");
    app.setApplicationDisplayName("ReelPlay Preview");
    app.setOrganizationName("ReelPlay Project");
    app.setOrganizationDomain("reelplay.org");

    // Initialize logging
    QLoggingCategory::setFilterRules("reelplay.*=true");

    if (argc < 2) {
        fprintf(stderr, "Usage: %s <media-file>\n", argv[0]);
        return 1;
    }

    // Dark theme
    app.setStyle(QStyleFactory::create("Fusion"));
    QPalette darkPalette;
    darkPalette.setColor(QPalette::Window, QColor(30, 30, 30));
    darkPalette.setColor(QPalette::WindowText, Qt::white);
    darkPalette.setColor(QPalette::Base, QColor(25, 25, 25));
    darkPalette.setColor(QPalette::Text, Qt::white);
    darkPalette.setColor(QPalette::Button, QColor(35, 35, 35));
    darkPalette.setColor(QPalette::ButtonText, Qt::white);
    darkPalette.setColor(QPalette::Highlight, QColor(42, 130, 218));
    darkPalette.setColor(QPalette::HighlightedText, Qt::black);
    app.setPalette(darkPalette);

    QString mediaPath = QString::fromLocal8Bit(argv[1]);
    QFileInfo mediaInfo(mediaPath);
    if (mediaInfo.isRelative()) {
        mediaPath = mediaInfo.absoluteFilePath();
    }

    QWidget window;
    window.setWindowTitle(QStringLiteral("ReelPlay - %1").arg(mediaInfo.fileName()));
    window.resize(960, 600);

    auto* layout = new QVBoxLayout(&window);
    auto* videoWidget = new QVideoWidget(&window);
    auto* statusLabel = new QLabel(QStringLiteral("Idle"), &window);
    layout->addWidget(videoWidget, 1);
    layout->addWidget(statusLabel);

    PlaybackCoordinator coordinator;

    QObject::connect(&coordinator, &PlaybackCoordinator::stateChanged, statusLabel,
                     [statusLabel](const LoadState& state) {
                         statusLabel->setText(state.toString());
                     });

    QObject::connect(&coordinator, &PlaybackCoordinator::playerChanged, videoWidget,
                     [videoWidget](PlayerResource* player) {
                         if (player) {
                             player->setVideoOutput(videoWidget);
                         }
                     });

    qCInfo(reelplayMain, "Opening %s", qPrintable(mediaPath));
    coordinator.prepare(
        rmp::ResourceLocator::FromString(mediaPath.toStdString()),
        [&coordinator]() {
            qCInfo(reelplayMain, "Ready (autoplay %s)",
                   coordinator.settings().autoPlay ? "on" : "off");
        },
        [](const rmp::Error& error) {
            qCWarning(reelplayMain, "Load failed: %s",
                      qPrintable(describeLoadFailure(error)));
        });

    window.show();

    int result = app.exec();

    qCInfo(reelplayMain, "ReelPlay shutdown complete");

    return result;
}
