#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QLoggingCategory>
#include <QDir>
#include <QStandardPaths>

#include "backend/library/albumloader.h"
#include "backend/library/catalogrelease.h"
#include "backend/playback/playbackengine.h"
#include "backend/playback/taskscheduler.h"
#include "backend/scrobble/lastfmclient.h"
#include "backend/system/mprismanager.h"
#include "backend/settings/settingsmanager.h"

namespace {

bool s_verbose = false;
QFile *s_logFile = nullptr;

QString getLogPath()
{
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataPath); // Ensure the directory exists
    return QDir(dataPath).filePath("vinylscrobbler.log");
}

void writeLine(const char *level, const QString &msg)
{
    const QString line = QString("%1 %2 %3")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODate), QString::fromLatin1(level), msg);
    fprintf(stderr, "%s\n", qPrintable(line));

    if (s_logFile && s_logFile->isOpen()) {
        QTextStream stream(s_logFile);
        stream << line << Qt::endl;
    }
}

} // namespace

// Message handler writing to stderr and the log file
void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {
    Q_UNUSED(context)

    switch (type) {
        case QtDebugMsg:
            if (s_verbose) {
                writeLine("DEBUG", msg);
            }
            break;
        case QtInfoMsg:
            writeLine("INFO", msg);
            break;
        case QtWarningMsg:
            // Always show warnings, they're important
            writeLine("WARNING", msg);
            break;
        case QtCriticalMsg:
            writeLine("CRITICAL", msg);
            break;
        case QtFatalMsg:
            writeLine("FATAL", msg);
            abort();
    }
}

int main(int argc, char *argv[])
{
    s_verbose = !qEnvironmentVariableIsEmpty("VINYLSCROBBLER_DEBUG");
    if (!s_verbose) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setOrganizationName("vinylscrobbler");
    app.setApplicationName("vinylscrobbler");

    QFile logFile(getLogPath());
    if (logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        s_logFile = &logFile;
    }

    // Install the custom message handler
    qInstallMessageHandler(messageHandler);

    if (!s_logFile) {
        qWarning() << "Main: Could not open log file" << logFile.fileName();
    }
    qInfo() << "Vinyl Scrobbler starting";

    bool autoPlay = false;
    QString releasePath;
    const QStringList arguments = app.arguments().mid(1);
    for (const QString &argument : arguments) {
        if (argument == "--play") {
            autoPlay = true;
        } else if (argument == "--help" || argument == "-h") {
            fprintf(stdout, "Usage: vinylscrobbler [--play] [release.json]\n");
            return 0;
        } else if (argument.startsWith("-")) {
            fprintf(stderr, "Unknown option %s\n", qPrintable(argument));
            return 1;
        } else {
            releasePath = argument;
        }
    }

    SettingsManager *settingsManager = SettingsManager::instance();
    settingsManager->setParent(&app);  // Parent to app for cleanup

    QtTaskScheduler scheduler;
    PlaybackEngine engine(&scheduler);
    AlbumLoader loader;

    LastFmClient *lastFm = nullptr;
    const QStringList missing = settingsManager->missingLastFmFields();
    if (!missing.isEmpty()) {
        qWarning() << "Main: Last.fm is not configured, missing" << missing.join(", ")
                   << "in" << settingsManager->fileName() << "- running without scrobbling";
    } else {
        lastFm = new LastFmClient(&app);
        lastFm->setCredentials(settingsManager->lastFmApiKey(), settingsManager->lastFmApiSecret());
        lastFm->setSessionKey(settingsManager->lastFmSessionKey());
        lastFm->setTransferTimeout(settingsManager->networkTimeoutMs());

        QObject::connect(lastFm, &LastFmClient::authenticated,
                         settingsManager, &SettingsManager::setLastFmSessionKey);
        QObject::connect(lastFm, &LastFmClient::authenticationFailed, [](const QString &message) {
            qWarning() << "Main: Last.fm sign-in failed:" << message;
        });

        if (!lastFm->hasSession()) {
            lastFm->authenticate(settingsManager->lastFmUsername(), settingsManager->lastFmPasswordHash());
        }

        if (settingsManager->scrobblingEnabled()) {
            engine.setScrobbleService(lastFm);
        }
        if (settingsManager->durationLookupEnabled()) {
            loader.setDurationLookup(lastFm);
        }
    }

    // Follow settings changes made while running
    QObject::connect(settingsManager, &SettingsManager::scrobblingEnabledChanged,
                     &engine, [&engine, lastFm](bool enabled) {
        engine.setScrobbleService(enabled ? lastFm : nullptr);
    });
    QObject::connect(settingsManager, &SettingsManager::durationLookupEnabledChanged,
                     &loader, [&loader, lastFm](bool enabled) {
        loader.setDurationLookup(enabled ? lastFm : nullptr);
    });

    QObject::connect(&loader, &AlbumLoader::albumLoaded, &engine,
                     [&engine, &autoPlay](const Vinyl::TrackList &tracks) {
        const Vinyl::PlaybackError error = engine.loadAlbum(tracks);
        if (error != Vinyl::PlaybackError::None) {
            qWarning() << "Main:" << Vinyl::errorString(error);
            return;
        }
        if (autoPlay) {
            autoPlay = false;
            engine.togglePlayback();
        }
    });

    QObject::connect(&engine, &PlaybackEngine::trackChanged,
                     [](const Vinyl::Track &track, bool isPlaying) {
        qInfo().noquote() << (isPlaying ? "Playing" : "Selected") << track.displayName()
                          << "by" << track.artist() << "[" + track.durationDisplay() + "]";
    });
    QObject::connect(&engine, &PlaybackEngine::progressChanged, [](int elapsed, int total) {
        qDebug() << "Main: Progress" << elapsed << "/" << total;
    });
    QObject::connect(&engine, &PlaybackEngine::albumEnded, []() {
        qInfo() << "End of album";
    });
    QObject::connect(&engine, &PlaybackEngine::error, [](const QString &message) {
        qWarning().noquote() << message;
    });

    MprisManager mprisManager(&engine, &loader);
    if (mprisManager.initialize()) {
        qDebug() << "Main: MPRIS manager initialized successfully";
    } else {
        qWarning() << "Main: Failed to initialize MPRIS manager";
    }

    if (!releasePath.isEmpty()) {
        QString errorMessage;
        const std::optional<Vinyl::CatalogRelease> release =
            Vinyl::CatalogRelease::fromFile(releasePath, &errorMessage);
        if (!release) {
            qCritical() << "Main: Could not read release" << releasePath << ":" << errorMessage;
            return 1;
        }
        const Vinyl::PlaybackError error = loader.load(*release);
        if (error != Vinyl::PlaybackError::None) {
            qCritical() << "Main:" << Vinyl::errorString(error);
            return 1;
        }
    } else if (autoPlay) {
        qWarning() << "Main: --play given without a release";
    }

    // Connect to application aboutToQuit signal for cleanup
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        qDebug() << "Main: Application about to quit, performing cleanup...";

        // Aborted lookups still answer; nothing may load or start playing now
        loader.cancel();
        QObject::disconnect(&loader, nullptr, &engine, nullptr);

        engine.shutdown();
        mprisManager.cleanup();

        if (lastFm) {
            lastFm->shutdown(settingsManager->shutdownTimeoutMs());
        }

        // Process any pending deletions before returning
        QCoreApplication::processEvents(QEventLoop::AllEvents, 100);

        qDebug() << "Main: Cleanup completed";
    });

    qDebug() << "Main: Starting event loop...";
    int result = app.exec();

    qInfo() << "Vinyl Scrobbler exiting with" << result;
    qInstallMessageHandler(nullptr);
    s_logFile = nullptr;
    return result;
}
