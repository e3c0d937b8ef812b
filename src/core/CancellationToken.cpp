#include "core/CancellationToken.h"

CancellationToken::CancellationToken()
    : state_(std::make_shared<QAtomicInt>(0))
{
}

void CancellationToken::cancel()
{
    state_->storeRelease(1);
}

bool CancellationToken::isCanceled() const
{
    return state_->loadAcquire() != 0;
}
