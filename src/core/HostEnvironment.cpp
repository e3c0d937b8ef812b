#include "core/HostEnvironment.h"

#include "core/CancellationToken.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace {
const char *kDockerMarker = ".dockerenv";
const char *kPodmanMarker = "run/.containerenv";
const char *kInitCgroup = "proc/1/cgroup";
const char *kSelfExe = "/proc/self/exe";
constexpr qint64 kMaxCgroupBytes = 64 * 1024;

const char *kContainerRuntimes[] = {"docker", "kubepods", "containerd", "libpod", "lxc"};
}

SystemHostEnvironment::SystemHostEnvironment(const QString &rootPath)
    : rootPath_(rootPath)
{
    if (rootPath_.isEmpty()) {
        rootPath_ = QDir::rootPath();
    }
}

QString SystemHostEnvironment::value(const QString &name) const
{
    return qEnvironmentVariable(name.toLocal8Bit().constData());
}

QString SystemHostEnvironment::baseDirectory() const
{
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationDirPath();
    }
    QFileInfo exe(QString::fromLatin1(kSelfExe));
    QString canonical = exe.canonicalFilePath();
    if (!canonical.isEmpty()) {
        return QFileInfo(canonical).absolutePath();
    }
    return QDir::currentPath();
}

QString SystemHostEnvironment::currentDirectory() const
{
    return QDir::currentPath();
}

bool SystemHostEnvironment::isFunctionHost() const
{
    return !value(QStringLiteral("AZURE_FUNCTIONS_ENVIRONMENT")).isEmpty()
           || !value(QStringLiteral("FUNCTIONS_WORKER_RUNTIME")).isEmpty();
}

bool SystemHostEnvironment::isAppServiceHost() const
{
    return !value(QStringLiteral("WEBSITE_SITE_NAME")).isEmpty();
}

bool SystemHostEnvironment::isCiRunner() const
{
    return isTrueValue(QStringLiteral("GITHUB_ACTIONS"));
}

bool SystemHostEnvironment::isContainer(const CancellationToken &token) const
{
    if (isTrueValue(QStringLiteral("DOTNET_RUNNING_IN_CONTAINER"))
        || isTrueValue(QStringLiteral("RUNNING_IN_CONTAINER"))
        || !value(QStringLiteral("container")).isEmpty()) {
        return true;
    }
    if (token.isCanceled()) {
        return false;
    }

    QDir root(rootPath_);
    if (QFileInfo::exists(root.filePath(kDockerMarker)) || QFileInfo::exists(root.filePath(kPodmanMarker))) {
        return true;
    }
    return cgroupMentionsContainer(token);
}

bool SystemHostEnvironment::isTrueValue(const QString &name) const
{
    return value(name).trimmed().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

bool SystemHostEnvironment::cgroupMentionsContainer(const CancellationToken &token) const
{
    QFile file(QDir(rootPath_).filePath(kInitCgroup));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }
    const QString content = QString::fromUtf8(file.read(kMaxCgroupBytes));
    if (token.isCanceled()) {
        return false;
    }
    for (const char *runtime : kContainerRuntimes) {
        if (content.contains(QLatin1String(runtime), Qt::CaseInsensitive)) {
            qDebug() << "SystemHostEnvironment detected container runtime:" << runtime;
            return true;
        }
    }
    return false;
}
