#pragma once

// Process-wide log setup on top of Qt's message macros.
namespace Logging {

// Timestamped lines on stderr, one mutex-guarded write per message.
void installMessageHandler();

// 0 = warnings only, 1 = info, 2 = debug.  Out-of-range values clamp.
void applyLogLevel(int level);

int currentLogLevel();

} // namespace Logging
