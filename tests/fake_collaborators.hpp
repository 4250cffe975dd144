#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <QPointer>
#include <QSemaphore>

#include "common/errors.hpp"
#include "supervisor/collaborators.hpp"

// In-memory collaborators for driving SyncSupervisor without a real service.

class FakeProcessRunner : public syncwarden::ProcessRunner
{
public:
    void configure(const syncwarden::ProcessLaunchOptions &options) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        lastOptions = options;
        ++configureCount;
    }

    void start() override
    {
        ++startCount;
        emit starting();
    }

    void kill() override { ++killCount; }
    void killAllInstances() override { ++killAllCount; }

    syncwarden::ProcessLaunchOptions options()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return lastOptions;
    }

    std::atomic<int> configureCount{0};
    std::atomic<int> startCount{0};
    std::atomic<int> killCount{0};
    std::atomic<int> killAllCount{0};

private:
    std::mutex mutex;
    syncwarden::ProcessLaunchOptions lastOptions;
};

class FakeApiClient : public syncwarden::ApiClient
{
public:
    syncwarden::ServiceConfig fetchConfig() override
    {
        if (failConfig) {
            throw syncwarden::ApiError("config unavailable", 500);
        }
        std::lock_guard<std::mutex> lock(mutex);
        return config;
    }

    syncwarden::SystemInfo fetchSystemInfo() override
    {
        std::lock_guard<std::mutex> lock(mutex);
        return systemInfo;
    }

    syncwarden::ServiceVersion fetchVersion() override
    {
        std::lock_guard<std::mutex> lock(mutex);
        return version;
    }

    syncwarden::ServiceConnections fetchConnections() override
    {
        ++connectionsFetchCount;
        std::lock_guard<std::mutex> lock(mutex);
        return connections;
    }

    syncwarden::IgnorePatterns fetchIgnores(const std::string &folderId) override
    {
        ++ignoresFetchCount;
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = ignores.find(folderId);
        return it == ignores.end() ? syncwarden::IgnorePatterns{} : it->second;
    }

    std::vector<syncwarden::ServiceEvent> fetchEvents(std::int64_t sinceId,
                                                      int limit,
                                                      const syncwarden::CancellationToken &token) override
    {
        std::vector<syncwarden::ServiceEvent> batch;
        {
            std::lock_guard<std::mutex> lock(mutex);
            eventRequests.emplace_back(sinceId, limit);
            if (!eventBatches.empty()) {
                batch = std::move(eventBatches.front());
                eventBatches.erase(eventBatches.begin());
            }
        }
        if (!batch.empty()) {
            return batch;
        }
        // Nothing queued: behave like an idle long poll.
        token.waitFor(std::chrono::milliseconds(200));
        token.throwIfCancellationRequested();
        return {};
    }

    void scan(const std::string &folderId, const std::string &subPath) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        scans.emplace_back(folderId, subPath);
    }

    void restart() override { ++restartCount; }
    void shutdown() override { ++shutdownCount; }

    void setIgnores(const std::string &folderId, syncwarden::IgnorePatterns patterns)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ignores[folderId] = std::move(patterns);
    }

    void queueEvents(std::vector<syncwarden::ServiceEvent> events)
    {
        std::lock_guard<std::mutex> lock(mutex);
        eventBatches.push_back(std::move(events));
    }

    std::vector<std::pair<std::int64_t, int>> requestedEvents()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return eventRequests;
    }

    std::vector<std::pair<std::string, std::string>> requestedScans()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return scans;
    }

    // Set before the client is handed out; read from worker threads.
    syncwarden::ServiceConfig config;
    syncwarden::SystemInfo systemInfo;
    syncwarden::ServiceVersion version;
    syncwarden::ServiceConnections connections;
    std::atomic<bool> failConfig{false};

    std::atomic<int> connectionsFetchCount{0};
    std::atomic<int> ignoresFetchCount{0};
    std::atomic<int> restartCount{0};
    std::atomic<int> shutdownCount{0};

private:
    std::mutex mutex;
    std::map<std::string, syncwarden::IgnorePatterns> ignores;
    std::vector<std::vector<syncwarden::ServiceEvent>> eventBatches;
    std::vector<std::pair<std::int64_t, int>> eventRequests;
    std::vector<std::pair<std::string, std::string>> scans;
};

class FakeApiClientFactory : public syncwarden::ApiClientFactory
{
public:
    std::shared_ptr<syncwarden::ApiClient> createClient(const QUrl &address,
                                                        const QString &apiKey,
                                                        std::chrono::milliseconds connectTimeout,
                                                        const syncwarden::CancellationToken &token) override
    {
        ++createCount;
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastAddress = address;
            lastApiKey = apiKey;
            lastTimeout = connectTimeout;
        }
        if (gate) {
            while (!gate->tryAcquire(1, 20)) {
                token.throwIfCancellationRequested();
            }
        }
        token.throwIfCancellationRequested();
        if (fail) {
            throw syncwarden::ApiError("connection refused");
        }
        return client;
    }

    QUrl address()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return lastAddress;
    }

    QString apiKey()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return lastApiKey;
    }

    std::chrono::milliseconds timeout()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return lastTimeout;
    }

    std::shared_ptr<FakeApiClient> client = std::make_shared<FakeApiClient>();
    QSemaphore *gate = nullptr;
    std::atomic<bool> fail{false};
    std::atomic<int> createCount{0};

private:
    std::mutex mutex;
    QUrl lastAddress;
    QString lastApiKey;
    std::chrono::milliseconds lastTimeout{0};
};

class FakeEventWatcher : public syncwarden::EventWatcher
{
public:
    void start() override { ++startCount; }
    void dispose() override { ++disposeCount; }

    std::atomic<int> startCount{0};
    std::atomic<int> disposeCount{0};
};

class FakeEventWatcherFactory : public syncwarden::EventWatcherFactory
{
public:
    std::unique_ptr<syncwarden::EventWatcher> createEventWatcher(std::shared_ptr<syncwarden::ApiClient> client) override
    {
        Q_UNUSED(client)
        auto watcher = std::make_unique<FakeEventWatcher>();
        std::lock_guard<std::mutex> lock(mutex);
        created.emplace_back(watcher.get());
        return watcher;
    }

    int createdCount()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(created.size());
    }

    FakeEventWatcher *last()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return created.empty() ? nullptr : created.back().data();
    }

private:
    std::mutex mutex;
    std::vector<QPointer<FakeEventWatcher>> created;
};

class FakeConnectionsWatcher : public syncwarden::ConnectionsWatcher
{
public:
    void start() override { ++startCount; }
    void dispose() override { ++disposeCount; }

    std::atomic<int> startCount{0};
    std::atomic<int> disposeCount{0};
};

class FakeConnectionsWatcherFactory : public syncwarden::ConnectionsWatcherFactory
{
public:
    std::unique_ptr<syncwarden::ConnectionsWatcher> createConnectionsWatcher(std::shared_ptr<syncwarden::ApiClient> client) override
    {
        Q_UNUSED(client)
        auto watcher = std::make_unique<FakeConnectionsWatcher>();
        std::lock_guard<std::mutex> lock(mutex);
        created.emplace_back(watcher.get());
        return watcher;
    }

    FakeConnectionsWatcher *last()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return created.empty() ? nullptr : created.back().data();
    }

private:
    std::mutex mutex;
    std::vector<QPointer<FakeConnectionsWatcher>> created;
};
