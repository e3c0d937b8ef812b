#pragma once

#include <QAtomicInt>
#include <memory>

// Copies share one flag, so a token handed to a worker can be canceled
// from the thread that created it.
class CancellationToken
{
public:
    CancellationToken();

    void cancel();
    bool isCanceled() const;

private:
    std::shared_ptr<QAtomicInt> state_;
};
