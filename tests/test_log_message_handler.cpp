#include <gtest/gtest.h>

#include "core/LogMessageHandler.h"

#include <QFile>
#include <QTemporaryDir>

TEST(LogMessageHandler, LevelNames) {
    EXPECT_EQ(logLevelText(QtDebugMsg), "DEBUG");
    EXPECT_EQ(logLevelText(QtInfoMsg), "INFO");
    EXPECT_EQ(logLevelText(QtWarningMsg), "WARN");
    EXPECT_EQ(logLevelText(QtCriticalMsg), "CRIT");
}

TEST(LogMessageHandler, FormatIncludesContext) {
    QMessageLogContext context("ResourcesPathResolver.cpp", 42, "resolve", "default");
    QString line = formatLogLine(QtWarningMsg, context, "falling back");
    EXPECT_TRUE(line.contains(" [WARN] ResourcesPathResolver.cpp:42 falling back"));
    EXPECT_TRUE(line.endsWith('\n'));
}

TEST(LogMessageHandler, WritesToFileAboveMinimumLevel) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QString logPath = tmp.filePath("logs/resources.log");

    installLogMessageHandler(logPath, QtInfoMsg);
    qDebug() << "dropped debug line";
    qInfo() << "kept info line";
    installLogMessageHandler();
    qInstallMessageHandler(nullptr);

    QFile file(logPath);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QString content = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(content.contains("kept info line"));
    EXPECT_FALSE(content.contains("dropped debug line"));
}

TEST(LogMessageHandler, UnopenableLogFileFallsBackToStderr) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QString blocker = tmp.filePath("not-a-directory");
    {
        QFile file(blocker);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("x");
    }
    QString logPath = blocker + "/resources.log";

    installLogMessageHandler(logPath, QtInfoMsg);
    qInfo() << "first line after failed open";
    qWarning() << "second line after failed open";
    installLogMessageHandler();
    qInstallMessageHandler(nullptr);

    EXPECT_FALSE(QFile::exists(logPath));
    QFile file(blocker);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), QByteArray("x"));
}
