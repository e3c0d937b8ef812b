#include "core/AncestorSearch.h"

#include "core/CancellationToken.h"
#include "core/DirectoryProbe.h"

#include <QDir>
#include <QFileInfo>

QString normalizeDirectoryPath(const QString &path)
{
    if (path.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(QDir(path).absolutePath());
}

QString findUpForDirectory(const QString &startDirectory,
                           const QString &targetName,
                           const QString &stopAtInclusive,
                           const DirectoryProbe &probe,
                           const CancellationToken &token)
{
    if (startDirectory.isEmpty() || targetName.isEmpty()) {
        return {};
    }

    QString current = normalizeDirectoryPath(startDirectory);
    const QString stop = normalizeDirectoryPath(stopAtInclusive);

    while (!token.isCanceled()) {
        const QString candidate = QDir(current).filePath(targetName);
        if (probe.exists(candidate, token)) {
            return candidate;
        }

        if (!stop.isEmpty() && current.compare(stop, Qt::CaseInsensitive) == 0) {
            return {};
        }

        const QString parent = QFileInfo(current).path();
        if (parent.isEmpty() || parent == current || QDir(current).isRoot()) {
            return {};
        }
        current = normalizeDirectoryPath(parent);
    }
    return {};
}
