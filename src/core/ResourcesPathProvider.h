#pragma once

#include "core/CancellationToken.h"

#include <QString>

// Resolves the absolute path of the Resources directory and of files under it.
// Both calls return an empty string only when the token was canceled.
class ResourcesPathProvider
{
public:
    virtual ~ResourcesPathProvider() = default;

    virtual QString get(const CancellationToken &token = CancellationToken()) = 0;
    virtual QString getResourceFilePath(const QString &fileName,
                                        const CancellationToken &token = CancellationToken()) = 0;
};
