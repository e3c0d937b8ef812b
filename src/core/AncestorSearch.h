#pragma once

#include <QString>

class CancellationToken;
class DirectoryProbe;

// Absolute, cleaned path without trailing separators. The root stays "/".
QString normalizeDirectoryPath(const QString &path);

// Walks from startDirectory towards the filesystem root and returns the first
// existing "<ancestor>/<targetName>", nearest ancestor first. When
// stopAtInclusive is set the walk ends after testing that directory's own
// child. Returns an empty string when nothing is found or the token fires.
QString findUpForDirectory(const QString &startDirectory,
                           const QString &targetName,
                           const QString &stopAtInclusive,
                           const DirectoryProbe &probe,
                           const CancellationToken &token);
