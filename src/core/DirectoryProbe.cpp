#include "core/DirectoryProbe.h"

#include "core/CancellationToken.h"

#include <QFileInfo>

bool FileSystemDirectoryProbe::exists(const QString &path, const CancellationToken &token) const
{
    if (path.isEmpty() || token.isCanceled()) {
        return false;
    }
    QFileInfo info(path);
    return info.exists() && info.isDir();
}
