#pragma once

#include <chrono>
#include <memory>

#include "service/polling_worker.hpp"
#include "supervisor/collaborators.hpp"

namespace syncwarden {

/**
 * PollingEventWatcher long-polls the service event log on its own thread and
 * republishes the events the supervisor cares about as signals.
 *
 * Events that happened before start() are skipped: the first poll only
 * records the newest event id.
 */
class PollingEventWatcher : public EventWatcher
{
    Q_OBJECT
public:
    explicit PollingEventWatcher(std::shared_ptr<ApiClient> client, QObject *parent = nullptr);
    ~PollingEventWatcher() override;

    void start() override;
    void dispose() override;

private:
    void run(const CancellationToken &token);
    void dispatch(const ServiceEvent &event);

    std::shared_ptr<ApiClient> m_client;
    PollingWorker m_worker;
};

class PollingEventWatcherFactory : public EventWatcherFactory
{
public:
    std::unique_ptr<EventWatcher> createEventWatcher(std::shared_ptr<ApiClient> client) override;
};

} // namespace syncwarden
