#include "core/ResolvedPathCache.h"

ResolvedPathCache::~ResolvedPathCache()
{
    delete slot_.loadAcquire();
}

QString ResolvedPathCache::get() const
{
    const QString *published = slot_.loadAcquire();
    return published ? *published : QString();
}

bool ResolvedPathCache::isResolved() const
{
    return slot_.loadAcquire() != nullptr;
}

bool ResolvedPathCache::trySet(const QString &value)
{
    if (value.isEmpty() || slot_.loadAcquire() != nullptr) {
        return false;
    }
    auto *candidate = new QString(value);
    if (slot_.testAndSetOrdered(nullptr, candidate)) {
        return true;
    }
    delete candidate;
    return false;
}
