#pragma once

#include <QString>

class CancellationToken;

class DirectoryProbe
{
public:
    virtual ~DirectoryProbe() = default;

    // False for missing paths, unreadable paths and canceled tokens.
    virtual bool exists(const QString &path, const CancellationToken &token) const = 0;
};

class FileSystemDirectoryProbe : public DirectoryProbe
{
public:
    bool exists(const QString &path, const CancellationToken &token) const override;
};
