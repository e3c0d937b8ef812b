#pragma once

#include <QAtomicPointer>
#include <QString>

// Single slot that moves from empty to resolved exactly once.
class ResolvedPathCache
{
public:
    ResolvedPathCache() = default;
    ~ResolvedPathCache();

    QString get() const;
    bool isResolved() const;

    // Publishes value only if the slot is still empty. Returns true when this
    // call's value is the published one. Empty values are never published.
    bool trySet(const QString &value);

private:
    Q_DISABLE_COPY(ResolvedPathCache)

    // Owns the published string; a losing trySet deletes its own candidate.
    QAtomicPointer<const QString> slot_;
};
