#include "core/ResourceLocator.h"

#include "core/ResourcesPathResolver.h"

#include <QAtomicInt>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace {
QAtomicInt g_loggedRoot = 0;
}

QString ResourceLocator::resourcesRoot()
{
    QString root = ResourcesPathResolver::shared().get();
    if (g_loggedRoot.testAndSetRelaxed(0, 1)) {
        if (QFileInfo(root).isDir()) {
            qInfo() << "ResourceLocator using root:" << root;
        } else {
            qWarning() << "ResourceLocator root does not exist yet:" << root;
        }
    }
    return root;
}

QString ResourceLocator::resolveResource(const QString &relativePath)
{
    QDir dir(resourcesRoot());
    return dir.filePath(relativePath);
}
