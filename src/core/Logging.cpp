#include "Logging.h"
#include "CrashHandler.h"

#include <QDateTime>
#include <QLoggingCategory>
#include <QMutex>
#include <QString>
#include <atomic>
#include <cstdio>

namespace Logging {

static std::atomic<int> s_level{1};

void installMessageHandler()
{
    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        const char* kind = "";
        switch (type) {
        case QtDebugMsg:    kind = "D"; break;
        case QtInfoMsg:     kind = "I"; break;
        case QtWarningMsg:  kind = "W"; break;
        case QtCriticalMsg: kind = "C"; break;
        case QtFatalMsg:    kind = "F"; break;
        }
        const QString line = QStringLiteral("[%1] %2 %3\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")),
                 QLatin1String(kind), msg);
        const QByteArray utf8 = line.toUtf8();
        fprintf(stderr, "%s", utf8.constData());
        fflush(stderr);
        if (type == QtFatalMsg)
            CrashHandler::recordFatalMessage(msg);
    });
}

void applyLogLevel(int level)
{
    level = qBound(0, level, 2);
    s_level.store(level);

    QString rules;
    switch (level) {
    case 0:
        rules = QStringLiteral("*.debug=false\n*.info=false");
        break;
    case 1:
        rules = QStringLiteral("*.debug=false\n*.info=true");
        break;
    default:
        rules = QStringLiteral("*.debug=true\n*.info=true");
        break;
    }
    QLoggingCategory::setFilterRules(rules);
}

int currentLogLevel()
{
    return s_level.load();
}

} // namespace Logging
