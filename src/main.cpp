#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <memory>

#include "core/CrashHandler.h"
#include "core/Logging.h"
#include "core/MusicData.h"
#include "core/PlaybackQueue.h"
#include "core/Settings.h"
#include "session/PlayCoordinator.h"
#include "session/SessionSupervisor.h"
#include "sources/JsonCatalogSource.h"
#include "sources/MatchRanker.h"
#include "sources/SourceRegistry.h"
#include "sources/TrackResolver.h"

#ifndef VOICEDECK_VERSION
#define VOICEDECK_VERSION "0.0.0"
#endif

namespace {

enum ExitCode {
    ExitFound = 0,
    ExitConfigError = 1,
    ExitNotFound = 2,
    ExitUnreachable = 3
};

int exitCodeFor(MatchStatus status)
{
    switch (status) {
    case MatchStatus::Found:                 return ExitFound;
    case MatchStatus::NotFound:              return ExitNotFound;
    case MatchStatus::AllSourcesUnreachable: return ExitUnreachable;
    }
    return ExitNotFound;
}

QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

QString describe(const Track& t)
{
    QString line = t.title;
    if (!t.artist.isEmpty() && t.kind != QueryType::Artist)
        line += QStringLiteral(" - ") + t.artist;
    if (!t.album.isEmpty() && t.kind == QueryType::Track)
        line += QStringLiteral(" [") + t.album + QLatin1Char(']');
    if (t.duration > 0)
        line += QStringLiteral(" (") + formatDuration(t.duration) + QLatin1Char(')');
    return line + QStringLiteral("  @") + t.sourceId;
}

// Registers one catalog-backed source per enabled id.
bool buildRegistry(const Settings& settings, SourceRegistry* registry)
{
    for (const QString& id : settings.enabledSources()) {
        SchemaProfile profile;
        if (!SchemaProfile::byName(settings.sourceSchema(id), &profile)) {
            qCritical() << "[Startup] unknown schema for" << id << ":" << settings.sourceSchema(id);
            return false;
        }

        const QString catalog = settings.sourceCatalog(id);
        if (catalog.isEmpty()) {
            qCritical() << "[Startup] no catalog configured for" << id;
            return false;
        }

        auto source = std::make_shared<JsonCatalogSource>(id, id, profile);
        QString error;
        if (!source->loadFromFile(catalog, &error)) {
            qCritical() << "[Startup]" << id << "catalog unusable:" << error;
            return false;
        }
        source->setStreamUrlTemplate(settings.sourceStreamUrl(id));
        registry->add(source, profile);
    }
    return true;
}

void printHead(const PlayResult& result, const TrackResolver& resolver)
{
    if (result.hasMatch)
        out() << "Match: " << describe(result.match.track)
              << QStringLiteral("  (score %1)").arg(result.match.score, 0, 'f', 2) << Qt::endl;
    for (const Track& t : result.headSlice) {
        QUrl url;
        if (auto source = resolver.registry()->source(t.sourceId))
            url = source->streamLocatorFor(t);
        out() << "  > " << describe(t);
        if (!url.isEmpty())
            out() << "  " << url.toString();
        out() << Qt::endl;
    }
    out() << result.remainder.size() << " more tracks resolving in the background" << Qt::endl;
}

void printQueue(const PlaybackQueue& queue)
{
    const PlaybackQueue::Snapshot snap = queue.snapshot();
    out() << "Queue (" << snap.entries.size() << " tracks, mode "
          << playbackModeName(snap.mode) << "):" << Qt::endl;
    for (int i = 0; i < snap.entries.size(); ++i) {
        out() << (i == snap.cursor ? " * " : "   ")
              << QString::number(i + 1).rightJustified(3) << ". "
              << describe(snap.entries[i].track) << Qt::endl;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("VoiceDeck"));
    QCoreApplication::setApplicationName(QStringLiteral("VoiceDeck"));
    CrashHandler::install();  // first, so startup crashes are captured too

    QCoreApplication app(argc, argv);
    app.setApplicationVersion(QStringLiteral(VOICEDECK_VERSION));
    Logging::installMessageHandler();

    if (CrashHandler::rotatePreviousLog())
        qWarning() << "[Startup] Previous crash report kept next to" << CrashHandler::crashLogPath();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Voice-driven multi-source music queue"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Settings INI file."), QStringLiteral("file"));
    QCommandLineOption modeOption(QStringLiteral("mode"),
        QStringLiteral("Playback mode: linear, repeat-one, repeat-all, shuffle."),
        QStringLiteral("mode"), QStringLiteral("linear"));
    QCommandLineOption logOption(QStringLiteral("log-level"),
        QStringLiteral("0 = warnings, 1 = info, 2 = debug. Overrides log/level."),
        QStringLiteral("level"));
    parser.addOptions({configOption, modeOption, logOption});
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("play <type> <text> | search <type> <text> | random | favourites"));
    parser.process(app);

    Settings settings(Settings::resolvePath(parser.value(configOption)));
    Logging::applyLogLevel(parser.isSet(logOption) ? parser.value(logOption).toInt()
                                                   : settings.logLevel());

    QStringList problems;
    if (!settings.validate(&problems)) {
        qCritical() << "[Startup] invalid configuration in" << settings.fileName();
        return ExitConfigError;
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0).toLower();
    PlaybackMode mode = PlaybackMode::Linear;
    if (!parsePlaybackMode(parser.value(modeOption), &mode)) {
        qCritical() << "[Startup] unknown mode:" << parser.value(modeOption);
        return ExitConfigError;
    }

    auto registry = std::make_shared<SourceRegistry>();
    if (!buildRegistry(settings, registry.get()))
        return ExitConfigError;

    auto resolver = std::make_shared<TrackResolver>(registry);
    auto queue = std::make_shared<PlaybackQueue>();
    queue->setSkipDuplicates(settings.skipDuplicates());
    queue->setRewindRestartThreshold(settings.rewindRestartMs());
    auto supervisor = std::make_shared<SessionSupervisor>(queue, resolver,
                                                          settings.joinTimeoutMs());

    RankerOptions rankerOptions;
    rankerOptions.threshold = settings.matchThreshold();
    rankerOptions.dedupTolerance = settings.dedupTolerance();
    rankerOptions.enableOrder = registry->ids();
    rankerOptions.priority = settings.sourcePriority();
    rankerOptions.preferHighBitrate = settings.preferHighBitrate();

    CoordinatorOptions coordinatorOptions;
    coordinatorOptions.songCount = settings.songCount();
    coordinatorOptions.headSlice = settings.headSlice();

    PlayCoordinator coordinator(queue, resolver, supervisor, MatchRanker(rankerOptions),
                                coordinatorOptions);

    if (command == QLatin1String("play") || command == QLatin1String("search")) {
        QueryType type = QueryType::Track;
        if (args.size() < 3 || !parseQueryType(args.at(1), &type)) {
            qCritical() << "[Startup] usage:" << command
                        << "<artist|album|track|genre|playlist> <text>";
            return ExitConfigError;
        }
        const QString text = args.mid(2).join(QLatin1Char(' '));

        if (command == QLatin1String("search")) {
            const RankOutcome ranked = coordinator.search(type, text);
            out() << matchStatusName(ranked.status) << Qt::endl;
            for (const RankedMatch& m : ranked.matches) {
                out() << QStringLiteral("%1  ").arg(m.score, 0, 'f', 2) << describe(m.track);
                for (const Track& alt : m.alternates)
                    out() << "  +" << alt.sourceId;
                out() << Qt::endl;
            }
            return exitCodeFor(ranked.status);
        }

        const PlayResult result = coordinator.resolveAndEnqueue(type, text, mode);
        out() << matchStatusName(result.status) << Qt::endl;
        if (!result.isFound())
            return exitCodeFor(result.status);
        printHead(result, *resolver);
        supervisor->waitForActive(-1);
        printQueue(*queue);
        return ExitFound;
    }

    if (command == QLatin1String("random") || command == QLatin1String("favourites")
        || command == QLatin1String("favorites")) {
        const PlayResult result = command == QLatin1String("random")
            ? coordinator.playRandom(mode)
            : coordinator.playFavourites(mode);
        out() << matchStatusName(result.status) << Qt::endl;
        if (!result.isFound())
            return exitCodeFor(result.status);
        printHead(result, *resolver);
        supervisor->waitForActive(-1);
        printQueue(*queue);
        return ExitFound;
    }

    qCritical() << "[Startup] unknown command:" << command;
    parser.showHelp(ExitConfigError);
}
