#pragma once

#include <chrono>
#include <memory>

#include "service/polling_worker.hpp"
#include "supervisor/collaborators.hpp"

namespace syncwarden {

// Rates are 0 for the first sample and never negative (counters reset when
// the service restarts).
ConnectionStats computeConnectionStats(const ItemConnectionData &total,
                                       const ConnectionStats *previous,
                                       double elapsedSeconds);

class PollingConnectionsWatcher : public ConnectionsWatcher
{
    Q_OBJECT
public:
    explicit PollingConnectionsWatcher(std::shared_ptr<ApiClient> client,
                                       std::chrono::milliseconds interval = std::chrono::seconds(2),
                                       QObject *parent = nullptr);
    ~PollingConnectionsWatcher() override;

    void start() override;
    void dispose() override;

private:
    void run(const CancellationToken &token);

    std::shared_ptr<ApiClient> m_client;
    std::chrono::milliseconds m_interval;
    PollingWorker m_worker;
};

class PollingConnectionsWatcherFactory : public ConnectionsWatcherFactory
{
public:
    std::unique_ptr<ConnectionsWatcher> createConnectionsWatcher(std::shared_ptr<ApiClient> client) override;
};

} // namespace syncwarden
