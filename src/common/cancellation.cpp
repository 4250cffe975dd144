#include "common/cancellation.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <utility>

#include <QDeadlineTimer>
#include <QThread>

namespace syncwarden {

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
    : m_flag(std::move(flag))
{
}

bool CancellationToken::isCancellationRequested() const
{
    return m_flag && m_flag->load();
}

void CancellationToken::throwIfCancellationRequested() const
{
    if (isCancellationRequested()) {
        throw OperationCancelledError();
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    constexpr qint64 kSliceMs = 50;
    QDeadlineTimer deadline(duration.count());
    while (!isCancellationRequested()) {
        const qint64 remaining = deadline.remainingTime();
        if (remaining <= 0) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(std::min(remaining, kSliceMs)));
    }
    return true;
}

CancellationSource::CancellationSource()
    : m_flag(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationSource::cancel()
{
    m_flag->store(true);
}

bool CancellationSource::isCancellationRequested() const
{
    return m_flag->load();
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(m_flag);
}

} // namespace syncwarden
