#include "core/playback_settings.h"

#include <QLoggingCategory>
#include <QSettings>
#include <QString>

Q_LOGGING_CATEGORY(reelplaySettings, "reelplay.settings")

namespace ReelPlay {

namespace {

const char* const kTimeoutKey = "playback/load_timeout_ms";
const char* const kAutoPlayKey = "playback/autoplay";
const char* const kTimeoutEnv = "REELPLAY_LOAD_TIMEOUT_MS";
const char* const kAutoPlayEnv = "REELPLAY_AUTOPLAY";

void parseTimeout(const QString& text, const char* source, std::chrono::milliseconds* out)
{
    bool ok = false;
    const qlonglong value = text.trimmed().toLongLong(&ok);
    if (!ok || value <= 0) {
        qCWarning(reelplaySettings, "Ignoring invalid load timeout from %s: '%s'",
                  source, qPrintable(text));
        return;
    }
    *out = std::chrono::milliseconds(value);
}

bool parseFlag(const QString& text)
{
    const QString v = text.trimmed().toLower();
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

}  // namespace

PlaybackSettings PlaybackSettings::load()
{
    QSettings store;
    return load(store);
}

PlaybackSettings PlaybackSettings::load(QSettings& store)
{
    PlaybackSettings settings;

    if (store.contains(kTimeoutKey)) {
        parseTimeout(store.value(kTimeoutKey).toString(), kTimeoutKey, &settings.loadTimeout);
    }
    if (store.contains(kAutoPlayKey)) {
        settings.autoPlay = parseFlag(store.value(kAutoPlayKey).toString());
    }

    settings.applyEnvironment();

    qCDebug(reelplaySettings, "Load timeout %lld ms, autoplay %s",
            static_cast<long long>(settings.loadTimeout.count()),
            settings.autoPlay ? "on" : "off");
    return settings;
}

void PlaybackSettings::applyEnvironment()
{
    if (qEnvironmentVariableIsSet(kTimeoutEnv)) {
        parseTimeout(qEnvironmentVariable(kTimeoutEnv), kTimeoutEnv, &loadTimeout);
    }
    if (qEnvironmentVariableIsSet(kAutoPlayEnv)) {
        autoPlay = parseFlag(qEnvironmentVariable(kAutoPlayEnv));
    }
}

}  // namespace ReelPlay
