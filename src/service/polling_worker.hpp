#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include <QThread>

#include "common/cancellation.hpp"

namespace syncwarden {

// One dedicated thread running a polling loop until stopped. Once stopped it
// cannot be started again.
class PollingWorker
{
public:
    PollingWorker() = default;
    ~PollingWorker();

    PollingWorker(const PollingWorker &) = delete;
    PollingWorker &operator=(const PollingWorker &) = delete;

    // loop must return soon after its token is cancelled.
    void start(std::function<void(const CancellationToken &)> loop);
    // Cancels the loop and joins the thread, unless called from the loop itself.
    void stop();

private:
    std::mutex m_mutex;
    CancellationSource m_cancel;
    std::unique_ptr<QThread> m_thread;
    bool m_stopped = false;
};

} // namespace syncwarden
