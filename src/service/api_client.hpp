#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include "supervisor/collaborators.hpp"

namespace syncwarden {

/**
 * HttpApiClient talks to the service REST API over Qt Network.
 *
 * Each call runs its own QNetworkAccessManager and QEventLoop on the calling
 * thread, so a single client can be shared by thread pool workers. Requests
 * carry the API key in the X-API-Key header.
 */
class HttpApiClient : public ApiClient
{
public:
    HttpApiClient(QUrl baseUrl,
                  QString apiKey,
                  std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));

    ServiceConfig fetchConfig() override;
    SystemInfo fetchSystemInfo() override;
    ServiceVersion fetchVersion() override;
    ServiceConnections fetchConnections() override;
    IgnorePatterns fetchIgnores(const std::string &folderId) override;
    std::vector<ServiceEvent> fetchEvents(std::int64_t sinceId,
                                          int limit,
                                          const CancellationToken &token) override;

    void scan(const std::string &folderId, const std::string &subPath) override;
    void restart() override;
    void shutdown() override;

    // Single GET /rest/system/ping bounded by timeout.
    void ping(std::chrono::milliseconds timeout, const CancellationToken &token);

    const QUrl &baseUrl() const { return m_baseUrl; }

private:
    enum class Verb { Get, Post };

    QByteArray execute(Verb verb,
                       const QString &path,
                       const QUrlQuery &query,
                       std::chrono::milliseconds timeout,
                       const CancellationToken &token);
    QByteArray get(const QString &path, const QUrlQuery &query = QUrlQuery());
    void post(const QString &path, const QUrlQuery &query = QUrlQuery());

    QUrl m_baseUrl;
    QString m_apiKey;
    std::chrono::milliseconds m_requestTimeout;
};

class HttpApiClientFactory : public ApiClientFactory
{
public:
    std::shared_ptr<ApiClient> createClient(const QUrl &address,
                                            const QString &apiKey,
                                            std::chrono::milliseconds connectTimeout,
                                            const CancellationToken &token) override;
};

} // namespace syncwarden
