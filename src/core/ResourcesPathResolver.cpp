#include "core/ResourcesPathResolver.h"

#include "core/AncestorSearch.h"
#include "core/DirectoryProbe.h"
#include "core/HostEnvironment.h"

#include <QDebug>
#include <QDir>
#include <QtConcurrent>
#include <utility>

ResourcesPathResolver::ResourcesPathResolver()
    : ResourcesPathResolver(std::make_shared<SystemHostEnvironment>(),
                            std::make_shared<FileSystemDirectoryProbe>())
{
}

ResourcesPathResolver::ResourcesPathResolver(std::shared_ptr<const HostEnvironment> environment,
                                             std::shared_ptr<const DirectoryProbe> probe,
                                             const ResourcesPathOptions &options)
    : environment_(std::move(environment))
    , probe_(std::move(probe))
    , options_(options)
{
    if (!environment_) {
        environment_ = std::make_shared<SystemHostEnvironment>();
    }
    if (!probe_) {
        probe_ = std::make_shared<FileSystemDirectoryProbe>();
    }
    if (options_.folderName.isEmpty()) {
        options_.folderName = ResourcesPathOptions().folderName;
    }
}

QString ResourcesPathResolver::get(const CancellationToken &token)
{
    const QString cached = cache_.get();
    if (!cached.isEmpty()) {
        return cached;
    }

    const QString resolved = resolve(token);
    if (resolved.isEmpty() || token.isCanceled()) {
        return {};
    }

    if (!cache_.trySet(resolved)) {
        qDebug() << "ResourcesPathResolver lost publish race, using" << cache_.get()
                 << "instead of" << resolved;
    }
    return cache_.get();
}

QString ResourcesPathResolver::getResourceFilePath(const QString &fileName, const CancellationToken &token)
{
    const QString root = get(token);
    if (root.isEmpty()) {
        return {};
    }
    return QDir(root).filePath(fileName);
}

QFuture<QString> ResourcesPathResolver::getAsync(const CancellationToken &token)
{
    return QtConcurrent::run([this, token]() {
        return get(token);
    });
}

QFuture<QString> ResourcesPathResolver::getResourceFilePathAsync(const QString &fileName,
                                                                 const CancellationToken &token)
{
    return QtConcurrent::run([this, fileName, token]() {
        return getResourceFilePath(fileName, token);
    });
}

QString ResourcesPathResolver::resolve(const CancellationToken &token) const
{
    const QList<ResourcesPathProbe> chain = probes();
    for (const ResourcesPathProbe &step : chain) {
        if (token.isCanceled()) {
            qDebug() << "ResourcesPathResolver canceled before probe" << step.name;
            return {};
        }
        if (step.applies && !step.applies(token)) {
            qDebug() << "ResourcesPathResolver skipped probe" << step.name;
            continue;
        }

        const QString found = step.locate(token);
        if (token.isCanceled()) {
            qDebug() << "ResourcesPathResolver canceled during probe" << step.name;
            return {};
        }
        if (!found.isEmpty()) {
            qInfo() << "ResourcesPathResolver using" << found << "from probe" << step.name;
            return found;
        }
        qDebug() << "ResourcesPathResolver probe" << step.name << "found nothing";
    }

    if (token.isCanceled()) {
        return {};
    }
    const QString fallback = buildOutputCandidate();
    qWarning() << "ResourcesPathResolver did not find a Resources directory, falling back to" << fallback;
    return fallback;
}

QList<ResourcesPathProbe> ResourcesPathResolver::probes() const
{
    QList<ResourcesPathProbe> chain;

    chain.append(ResourcesPathProbe{QStringLiteral("explicit-override"), nullptr,
        [this](const CancellationToken &token) { return locateOverride(token); }});

    chain.append(ResourcesPathProbe{QStringLiteral("build-output"), nullptr,
        [this](const CancellationToken &token) {
            return existingOrEmpty(buildOutputCandidate(), token);
        }});

    chain.append(ResourcesPathProbe{QStringLiteral("managed-hosting"),
        [this](const CancellationToken &) {
            return environment_->isFunctionHost() || environment_->isAppServiceHost();
        },
        [this](const CancellationToken &token) { return locateHosting(token); }});

    chain.append(ResourcesPathProbe{QStringLiteral("ci-workspace"),
        [this](const CancellationToken &) { return environment_->isCiRunner(); },
        [this](const CancellationToken &token) { return locateInWorkspace(token); }});

    // Container detection may read cgroup metadata, so it runs after the
    // cheap build-output check and only re-tests that same candidate.
    chain.append(ResourcesPathProbe{QStringLiteral("container"),
        [this](const CancellationToken &token) { return environment_->isContainer(token); },
        [this](const CancellationToken &token) {
            return existingOrEmpty(buildOutputCandidate(), token);
        }});

    chain.append(ResourcesPathProbe{QStringLiteral("ancestor-search"), nullptr,
        [this](const CancellationToken &token) { return locateAncestor(token); }});

    chain.append(ResourcesPathProbe{QStringLiteral("home-convention"), nullptr,
        [this](const CancellationToken &token) { return locateHosting(token); }});

    return chain;
}

bool ResourcesPathResolver::isResolved() const
{
    return cache_.isResolved();
}

const ResourcesPathOptions &ResourcesPathResolver::options() const
{
    return options_;
}

ResourcesPathResolver &ResourcesPathResolver::shared()
{
    static ResourcesPathResolver instance;
    return instance;
}

QString ResourcesPathResolver::buildOutputCandidate() const
{
    QString base = normalizeDirectoryPath(environment_->baseDirectory());
    if (base.isEmpty()) {
        base = normalizeDirectoryPath(environment_->currentDirectory());
    }
    if (base.isEmpty()) {
        base = QDir::currentPath();
    }
    return QDir(base).filePath(options_.folderName);
}

QString ResourcesPathResolver::hostingCandidate() const
{
    const QString home = environment_->value(options_.homeVariable);
    if (home.trimmed().isEmpty()) {
        return {};
    }
    return QDir(QDir(home).filePath(options_.hostingSubdirectory)).filePath(options_.folderName);
}

QString ResourcesPathResolver::existingOrEmpty(const QString &path, const CancellationToken &token) const
{
    if (path.isEmpty()) {
        return {};
    }
    return probe_->exists(path, token) ? path : QString();
}

QString ResourcesPathResolver::locateOverride(const CancellationToken &token) const
{
    const QString overrideDir = environment_->value(options_.overrideVariable);
    if (overrideDir.trimmed().isEmpty()) {
        return {};
    }
    if (!probe_->exists(overrideDir, token)) {
        qWarning() << "ResourcesPathResolver ignoring" << options_.overrideVariable << "="
                   << overrideDir << "because it is not a directory";
        return {};
    }
    return normalizeDirectoryPath(overrideDir);
}

QString ResourcesPathResolver::locateHosting(const CancellationToken &token) const
{
    return existingOrEmpty(hostingCandidate(), token);
}

QString ResourcesPathResolver::locateInWorkspace(const CancellationToken &token) const
{
    const QString workspace = environment_->value(options_.workspaceVariable);
    QString boundRoot;
    if (!workspace.trimmed().isEmpty() && probe_->exists(workspace, token)) {
        boundRoot = normalizeDirectoryPath(workspace);
    }

    const QString found = findUpForDirectory(environment_->currentDirectory(), options_.folderName,
                                             boundRoot, *probe_, token);
    if (!found.isEmpty()) {
        return found;
    }
    if (boundRoot.isEmpty()) {
        return {};
    }
    return existingOrEmpty(QDir(boundRoot).filePath(options_.folderName), token);
}

QString ResourcesPathResolver::locateAncestor(const CancellationToken &token) const
{
    return findUpForDirectory(environment_->currentDirectory(), options_.folderName, QString(),
                              *probe_, token);
}
