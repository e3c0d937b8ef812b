#pragma once

#include "core/CancellationToken.h"
#include "core/ResolvedPathCache.h"
#include "core/ResourcesPathProvider.h"

#include <QFuture>
#include <QList>
#include <QString>
#include <functional>
#include <memory>

class DirectoryProbe;
class HostEnvironment;

struct ResourcesPathOptions
{
    QString folderName = QStringLiteral("Resources");
    QString overrideVariable = QStringLiteral("RESOURCES_DIR");
    QString workspaceVariable = QStringLiteral("GITHUB_WORKSPACE");
    QString homeVariable = QStringLiteral("HOME");
    QString hostingSubdirectory = QStringLiteral("site/wwwroot");
};

struct ResourcesPathProbe
{
    QString name;
    // Unset means the probe applies everywhere.
    std::function<bool(const CancellationToken &)> applies;
    // Returns the existing directory or an empty string.
    std::function<QString(const CancellationToken &)> locate;
};

class ResourcesPathResolver : public ResourcesPathProvider
{
public:
    ResourcesPathResolver();
    ResourcesPathResolver(std::shared_ptr<const HostEnvironment> environment,
                          std::shared_ptr<const DirectoryProbe> probe,
                          const ResourcesPathOptions &options = ResourcesPathOptions());

    // Cached after the first completed resolution; concurrent first callers
    // all return the one published value.
    QString get(const CancellationToken &token = CancellationToken()) override;
    QString getResourceFilePath(const QString &fileName,
                                const CancellationToken &token = CancellationToken()) override;

    QFuture<QString> getAsync(const CancellationToken &token = CancellationToken());
    QFuture<QString> getResourceFilePathAsync(const QString &fileName,
                                              const CancellationToken &token = CancellationToken());

    // Runs the probe chain without touching the cache.
    QString resolve(const CancellationToken &token) const;
    QList<ResourcesPathProbe> probes() const;
    bool isResolved() const;

    const ResourcesPathOptions &options() const;

    static ResourcesPathResolver &shared();

private:
    Q_DISABLE_COPY(ResourcesPathResolver)

    QString buildOutputCandidate() const;
    QString hostingCandidate() const;
    QString existingOrEmpty(const QString &path, const CancellationToken &token) const;

    QString locateOverride(const CancellationToken &token) const;
    QString locateHosting(const CancellationToken &token) const;
    QString locateInWorkspace(const CancellationToken &token) const;
    QString locateAncestor(const CancellationToken &token) const;

    std::shared_ptr<const HostEnvironment> environment_;
    std::shared_ptr<const DirectoryProbe> probe_;
    ResourcesPathOptions options_;
    ResolvedPathCache cache_;
};
