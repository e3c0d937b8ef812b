#pragma once

#include <QString>
#include <QtGlobal>

QString logLevelText(QtMsgType type);
QString formatLogLine(QtMsgType type, const QMessageLogContext &context, const QString &msg);

// Writes to logFilePath when it can be opened, otherwise to stderr.
// Messages less severe than minimumType are dropped.
void installLogMessageHandler(const QString &logFilePath = QString(), QtMsgType minimumType = QtWarningMsg);
