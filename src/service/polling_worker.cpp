#include "service/polling_worker.hpp"

#include <utility>

namespace syncwarden {

PollingWorker::~PollingWorker()
{
    stop();
}

void PollingWorker::start(std::function<void(const CancellationToken &)> loop)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped || m_thread) {
        return;
    }

    const CancellationToken token = m_cancel.token();
    m_thread.reset(QThread::create([loop = std::move(loop), token]() { loop(token); }));
    m_thread->start();
}

void PollingWorker::stop()
{
    std::unique_ptr<QThread> thread;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
        m_cancel.cancel();
        thread = std::move(m_thread);
    }

    if (!thread) {
        return;
    }
    if (QThread::currentThread() == thread.get()) {
        // Joining from inside the loop would never return; let it unwind.
        QThread *self = thread.release();
        QObject::connect(self, &QThread::finished, self, &QObject::deleteLater);
        return;
    }
    thread->wait();
}

} // namespace syncwarden
