#include "utils/FileLogger.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

static QFile *logFile = nullptr;
static QMutex logMutex;
static bool logDebug = false;

static void messageHandler(QtMsgType type, const QMessageLogContext &context,
                           const QString &msg)
{
    Q_UNUSED(context);
    QMutexLocker locker(&logMutex);

    QString level;
    switch (type) {
        case QtDebugMsg:
            if (!logDebug) return;
            level = "DEBUG";
            break;
        case QtInfoMsg:     level = "INFO "; break;
        case QtWarningMsg:  level = "WARN "; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString logMessage = QString("[%1] [%2] %3\n").arg(timestamp, level, msg);

    // Console
    fprintf(stderr, "%s", logMessage.toLocal8Bit().constData());

    // File
    if (logFile && logFile->isOpen()) {
        QTextStream stream(logFile);
        stream << logMessage;
        stream.flush();
    }
}

void setupFileLogging(const QString &logDir, bool debugEnabled)
{
    logDebug = debugEnabled;

    if (!logDir.isEmpty()) {
        if (!QDir().mkpath(logDir))
            fprintf(stderr, "Failed to create log directory: %s\n", logDir.toLocal8Bit().constData());

        QString timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
        QString logFileName = QDir(logDir).filePath(QString("sheetcalc_%1.log").arg(timestamp));

        logFile = new QFile(logFileName);
        if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            fprintf(stderr, "Failed to open log file: %s\n", logFileName.toLocal8Bit().constData());
            delete logFile;
            logFile = nullptr;
        }
    }

    qInstallMessageHandler(messageHandler);

    if (logFile)
        qDebug() << "[FileLogger] Log file created:" << logFile->fileName();
}

void cleanupFileLogging()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker locker(&logMutex);
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}
