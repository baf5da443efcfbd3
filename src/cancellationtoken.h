#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>

// One-shot cancel latch, a new run needs a new token
class CancellationToken
{
public:
    void cancel() { m_cancelRequested.store(true); }
    bool isCancelled() const { return m_cancelRequested.load(); }

private:
    std::atomic<bool> m_cancelRequested{false};
};

#endif // CANCELLATIONTOKEN_H
