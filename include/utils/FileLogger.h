#ifndef FILE_LOGGER_H
#define FILE_LOGGER_H

#include <QString>

// Installs a Qt message handler that writes "[time] [LEVEL] message" to
// stderr and, when logDir is not empty, to logs/sheetcalc_<timestamp>.log.
// Debug messages are dropped unless debugEnabled is set.
void setupFileLogging(const QString &logDir, bool debugEnabled);

void cleanupFileLogging();

#endif // FILE_LOGGER_H
