#include "service/connections_watcher.hpp"

#include <algorithm>
#include <utility>

#include <QElapsedTimer>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace syncwarden {

namespace {

const QString kComponent = QStringLiteral("PollingConnectionsWatcher");

double ratePerSecond(std::int64_t current, std::int64_t previous, double elapsedSeconds)
{
    if (elapsedSeconds <= 0.0 || current < previous) {
        return 0.0;
    }
    return static_cast<double>(current - previous) / elapsedSeconds;
}

} // namespace

ConnectionStats computeConnectionStats(const ItemConnectionData &total,
                                       const ConnectionStats *previous,
                                       double elapsedSeconds)
{
    ConnectionStats stats;
    stats.inBytesTotal = total.inBytesTotal;
    stats.outBytesTotal = total.outBytesTotal;
    if (previous) {
        stats.inBytesPerSecond =
            ratePerSecond(total.inBytesTotal, previous->inBytesTotal, elapsedSeconds);
        stats.outBytesPerSecond =
            ratePerSecond(total.outBytesTotal, previous->outBytesTotal, elapsedSeconds);
    }
    return stats;
}

PollingConnectionsWatcher::PollingConnectionsWatcher(std::shared_ptr<ApiClient> client,
                                                     std::chrono::milliseconds interval,
                                                     QObject *parent)
    : ConnectionsWatcher(parent)
    , m_client(std::move(client))
    , m_interval(interval)
{
}

PollingConnectionsWatcher::~PollingConnectionsWatcher()
{
    dispose();
}

void PollingConnectionsWatcher::start()
{
    m_worker.start([this](const CancellationToken &token) { run(token); });
}

void PollingConnectionsWatcher::dispose()
{
    m_worker.stop();
}

void PollingConnectionsWatcher::run(const CancellationToken &token)
{
    ConnectionStats previous;
    bool havePrevious = false;
    QElapsedTimer sinceLast;

    do {
        try {
            const ServiceConnections connections = m_client->fetchConnections();
            const double elapsed = sinceLast.isValid() ? sinceLast.restart() / 1000.0 : 0.0;
            if (!sinceLast.isValid()) {
                sinceLast.start();
            }

            const ConnectionStats stats = computeConnectionStats(
                connections.total, havePrevious ? &previous : nullptr, elapsed);
            previous = stats;
            havePrevious = true;

            if (token.isCancellationRequested()) {
                return;
            }
            emit totalConnectionStatsChanged(stats);
        } catch (const std::exception &ex) {
            SWLOG_WARN(kComponent,
                       QStringLiteral("run"),
                       QStringLiteral("connections_poll_failed"),
                       QStringLiteral("api_error"),
                       QStringLiteral("retry_next_interval"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"error", ex.what()}});
        }
    } while (!token.waitFor(m_interval));
}

std::unique_ptr<ConnectionsWatcher> PollingConnectionsWatcherFactory::createConnectionsWatcher(std::shared_ptr<ApiClient> client)
{
    return std::make_unique<PollingConnectionsWatcher>(std::move(client));
}

} // namespace syncwarden
