#include "core/LogMessageHandler.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRecursiveMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>

namespace {
QFile *g_logFile = nullptr;
QString g_logFilePath;
QtMsgType g_minimumType = QtWarningMsg;
// Recursive so a message Qt emits while the log file is opened cannot deadlock.
QRecursiveMutex g_logMutex;

int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
        return 4;
    }
    return 0;
}

void logMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const QString line = formatLogLine(type, context, msg);
    {
        QMutexLocker locker(&g_logMutex);
        if (severity(type) < severity(g_minimumType) && type != QtFatalMsg) {
            return;
        }
        if (!g_logFile && !g_logFilePath.isEmpty()) {
            QDir().mkpath(QFileInfo(g_logFilePath).absolutePath());
            g_logFile = new QFile(g_logFilePath);
            if (!g_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                fprintf(stderr, "Unable to open log file %s\n", g_logFilePath.toLocal8Bit().constData());
                g_logFilePath.clear();
            }
        }

        if (g_logFile && g_logFile->isOpen()) {
            QTextStream stream(g_logFile);
            stream << line;
            stream.flush();
        } else {
            fprintf(stderr, "%s", line.toLocal8Bit().constData());
            fflush(stderr);
        }
    }

    if (type == QtFatalMsg) {
        abort();
    }
}
}

QString logLevelText(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("CRIT");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("LOG");
}

QString formatLogLine(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    QString contextInfo;
    if (context.file && context.line > 0) {
        contextInfo = QString("%1:%2").arg(context.file).arg(context.line);
    }
    return QString("%1 [%2] %3 %4\n").arg(timestamp, logLevelText(type), contextInfo, msg);
}

void installLogMessageHandler(const QString &logFilePath, QtMsgType minimumType)
{
    {
        QMutexLocker locker(&g_logMutex);
        if (g_logFile) {
            g_logFile->close();
            delete g_logFile;
            g_logFile = nullptr;
        }
        g_logFilePath = logFilePath;
        g_minimumType = minimumType;
    }
    qInstallMessageHandler(logMessageHandler);
}
