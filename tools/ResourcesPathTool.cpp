#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QFileInfo>
#include <QFuture>
#include <QTextStream>
#include <QThread>

#include "core/CancellationToken.h"
#include "core/LogMessageHandler.h"
#include "core/ResourcesPathResolver.h"

namespace {
constexpr int kPollIntervalMs = 5;

void printUsage(const QString &exeName)
{
    QTextStream out(stderr);
    out << "Usage: " << exeName << " [--file <name>] [--timeout-ms <n>] [--log-file <path>] [--verbose]\n";
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QString fileName;
    QString logFile;
    int timeoutMs = -1;
    bool verbose = false;

    const QStringList args = QCoreApplication::arguments();
    for (int i = 1; i < args.size(); ++i) {
        const QString arg = args.at(i);
        if (arg == "--file" && i + 1 < args.size()) {
            fileName = args.at(++i);
        } else if (arg == "--timeout-ms" && i + 1 < args.size()) {
            bool ok = false;
            timeoutMs = args.at(++i).toInt(&ok);
            if (!ok || timeoutMs < 0) {
                printUsage(QFileInfo(args.value(0)).fileName());
                return 1;
            }
        } else if (arg == "--log-file" && i + 1 < args.size()) {
            logFile = args.at(++i);
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            printUsage(QFileInfo(args.value(0)).fileName());
            return arg == "--help" ? 0 : 1;
        }
    }

    installLogMessageHandler(logFile, verbose ? QtDebugMsg : QtWarningMsg);

    ResourcesPathResolver &resolver = ResourcesPathResolver::shared();
    CancellationToken token;
    QFuture<QString> future = fileName.isEmpty() ? resolver.getAsync(token)
                                                 : resolver.getResourceFilePathAsync(fileName, token);

    if (timeoutMs >= 0) {
        QDeadlineTimer deadline(timeoutMs);
        while (!future.isFinished()) {
            if (deadline.hasExpired()) {
                token.cancel();
                break;
            }
            QThread::msleep(kPollIntervalMs);
        }
    }

    const QString path = future.result();
    if (path.isEmpty()) {
        QTextStream out(stderr);
        out << "Resolution canceled after " << timeoutMs << " ms\n";
        return 2;
    }

    QTextStream out(stdout);
    out << path << "\n";
    return 0;
}
