#include "service/event_watcher.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace syncwarden {

namespace {

const QString kComponent = QStringLiteral("PollingEventWatcher");

constexpr std::chrono::milliseconds kInitialBackoff{1000};
constexpr std::chrono::milliseconds kMaxBackoff{30000};

QString field(const nlohmann::json &data, const char *key)
{
    return QString::fromStdString(stringOrEmpty(data, key));
}

} // namespace

PollingEventWatcher::PollingEventWatcher(std::shared_ptr<ApiClient> client, QObject *parent)
    : EventWatcher(parent)
    , m_client(std::move(client))
{
}

PollingEventWatcher::~PollingEventWatcher()
{
    dispose();
}

void PollingEventWatcher::start()
{
    m_worker.start([this](const CancellationToken &token) { run(token); });
}

void PollingEventWatcher::dispose()
{
    m_worker.stop();
}

void PollingEventWatcher::run(const CancellationToken &token)
{
    std::int64_t lastId = 0;
    bool primed = false;
    std::chrono::milliseconds backoff = kInitialBackoff;

    while (!token.isCancellationRequested()) {
        try {
            if (!primed) {
                const auto latest = m_client->fetchEvents(0, 1, token);
                if (!latest.empty()) {
                    lastId = latest.back().id;
                }
                primed = true;
                SWLOG_DEBUG(kComponent,
                            QStringLiteral("run"),
                            QStringLiteral("event_backlog_skipped"),
                            QStringLiteral("watcher_started"),
                            QStringLiteral("long_poll"),
                            logging::defaultWho(),
                            QString(),
                            nlohmann::json{{"lastId", lastId}});
                continue;
            }

            const auto events = m_client->fetchEvents(lastId, 0, token);
            backoff = kInitialBackoff;
            for (const auto &event : events) {
                if (token.isCancellationRequested()) {
                    return;
                }
                if (event.id <= lastId) {
                    continue;
                }
                lastId = event.id;
                dispatch(event);
            }
        } catch (const OperationCancelledError &) {
            return;
        } catch (const std::exception &ex) {
            SWLOG_WARN(kComponent,
                       QStringLiteral("run"),
                       QStringLiteral("event_poll_failed"),
                       QStringLiteral("api_error"),
                       QStringLiteral("backoff"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"error", ex.what()},
                                      {"retryMs", backoff.count()}});
            if (token.waitFor(backoff)) {
                return;
            }
            backoff = std::min(backoff * 2, kMaxBackoff);
        }
    }
}

void PollingEventWatcher::dispatch(const ServiceEvent &event)
{
    const nlohmann::json &data = event.data;

    if (event.type == "ItemStarted") {
        emit itemStarted(field(data, "folder"), field(data, "item"));
    } else if (event.type == "ItemFinished") {
        emit itemFinished(field(data, "folder"), field(data, "item"));
    } else if (event.type == "DeviceConnected") {
        emit deviceConnected(field(data, "id"), field(data, "addr"));
    } else if (event.type == "DeviceDisconnected") {
        emit deviceDisconnected(field(data, "id"), field(data, "error"));
    } else if (event.type == "StateChanged") {
        emit syncStateChanged(field(data, "folder"),
                              parseSyncStateString(stringOrEmpty(data, "from")),
                              parseSyncStateString(stringOrEmpty(data, "to")));
    }
}

std::unique_ptr<EventWatcher> PollingEventWatcherFactory::createEventWatcher(std::shared_ptr<ApiClient> client)
{
    return std::make_unique<PollingEventWatcher>(std::move(client));
}

} // namespace syncwarden
