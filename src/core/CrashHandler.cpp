#include "CrashHandler.h"

#include <csignal>
#include <cstring>
#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>

#include <QDir>
#include <QFile>
#include <QMutex>
#include <QStandardPaths>

namespace {

char s_crashLogPath[512] = {0};
char s_requestContext[256] = {0};
char s_fatalMessage[512] = {0};
QMutex s_bufferMutex;

const char* signalName(int sig)
{
    switch (sig) {
    case SIGSEGV: return "SIGSEGV";
    case SIGABRT: return "SIGABRT";
    case SIGFPE:  return "SIGFPE";
    case SIGBUS:  return "SIGBUS";
    case SIGILL:  return "SIGILL";
    }
    return "UNKNOWN";
}

void copyInto(char* buffer, size_t size, const QString& text)
{
    QMutexLocker lock(&s_bufferMutex);
    const QByteArray utf8 = text.toUtf8();
    strncpy(buffer, utf8.constData(), size - 1);
    buffer[size - 1] = '\0';
}

// Async-signal-safe: write(2) only.
void writeText(int fd, const char* text)
{
    ssize_t rc = write(fd, text, strlen(text));
    (void)rc;
}

void writeField(int fd, const char* label, const char* value)
{
    if (value[0] == '\0')
        return;
    writeText(fd, label);
    writeText(fd, value);
    writeText(fd, "\n");
}

void crashSignalHandler(int sig)
{
    int fd = open(s_crashLogPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd >= 0) {
        writeText(fd, "VoiceDeck Crash Report\n");
        writeField(fd, "Signal: ", signalName(sig));
        writeField(fd, "Request: ", s_requestContext);
        writeField(fd, "Fatal: ", s_fatalMessage);
        writeText(fd, "\nBacktrace:\n");

        void* frames[64];
        int count = backtrace(frames, 64);
        backtrace_symbols_fd(frames, count, fd);

        close(fd);
    }

    _exit(128 + sig);
}

} // namespace

void CrashHandler::install()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
                  + QStringLiteral("/VoiceDeck");
    QDir().mkpath(dir);
    copyInto(s_crashLogPath, sizeof(s_crashLogPath), dir + QStringLiteral("/crash.log"));

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = crashSignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;  // one-shot, no recursive handler

    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL})
        sigaction(sig, &sa, nullptr);
}

QString CrashHandler::crashLogPath()
{
    return QString::fromUtf8(s_crashLogPath);
}

bool CrashHandler::rotatePreviousLog()
{
    const QString crashLog = crashLogPath();
    if (crashLog.isEmpty() || !QFile::exists(crashLog))
        return false;

    QString prevPath = crashLog;
    prevPath.replace(QStringLiteral(".log"), QStringLiteral("_prev.log"));
    QFile::remove(prevPath);
    return QFile::rename(crashLog, prevPath);
}

void CrashHandler::setRequestContext(const QString& context)
{
    copyInto(s_requestContext, sizeof(s_requestContext), context);
}

void CrashHandler::recordFatalMessage(const QString& message)
{
    copyInto(s_fatalMessage, sizeof(s_fatalMessage), message);
}
