#pragma once

#include <QString>

// Writes the fatal signal, the request being served and a backtrace to
// crash.log in the VoiceDeck data directory.  qFatal aborts, so a queue
// protocol violation lands here together with its message.
class CrashHandler {
public:
    static void install();
    static QString crashLogPath();

    // Moves a crash.log left by the previous run to crash_prev.log.
    // Returns false when there was none.
    static bool rotatePreviousLog();

    // Both are copied into fixed buffers; safe to call from any thread.
    static void setRequestContext(const QString& context);
    static void recordFatalMessage(const QString& message);
};
