#include "service/api_client.hpp"

#include <algorithm>
#include <utility>

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace syncwarden {

namespace {

const QString kComponent = QStringLiteral("HttpApiClient");

constexpr std::chrono::milliseconds kCancelPollInterval{100};
constexpr std::chrono::milliseconds kPingTimeout{2000};
constexpr std::chrono::milliseconds kPingRetryDelay{250};
// The service holds /rest/events open for this long when nothing happens.
constexpr int kEventsLongPollSeconds = 60;
constexpr std::chrono::milliseconds kEventsRequestTimeout{(kEventsLongPollSeconds + 15) * 1000};

template <typename T>
T decodePayload(const QByteArray &body, const QString &path)
{
    try {
        const nlohmann::json payload = nlohmann::json::parse(body.constBegin(), body.constEnd());
        if (payload.is_null()) {
            return T{};
        }
        return payload.get<T>();
    } catch (const nlohmann::json::exception &ex) {
        throw ApiError("invalid payload from " + path.toStdString() + ": " + ex.what());
    }
}

} // namespace

HttpApiClient::HttpApiClient(QUrl baseUrl,
                             QString apiKey,
                             std::chrono::milliseconds requestTimeout)
    : m_baseUrl(std::move(baseUrl))
    , m_apiKey(std::move(apiKey))
    , m_requestTimeout(requestTimeout)
{
}

ServiceConfig HttpApiClient::fetchConfig()
{
    const QString path = QStringLiteral("/rest/system/config");
    return decodePayload<ServiceConfig>(get(path), path);
}

SystemInfo HttpApiClient::fetchSystemInfo()
{
    const QString path = QStringLiteral("/rest/system/status");
    return decodePayload<SystemInfo>(get(path), path);
}

ServiceVersion HttpApiClient::fetchVersion()
{
    const QString path = QStringLiteral("/rest/system/version");
    return decodePayload<ServiceVersion>(get(path), path);
}

ServiceConnections HttpApiClient::fetchConnections()
{
    const QString path = QStringLiteral("/rest/system/connections");
    return decodePayload<ServiceConnections>(get(path), path);
}

IgnorePatterns HttpApiClient::fetchIgnores(const std::string &folderId)
{
    const QString path = QStringLiteral("/rest/db/ignores");
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("folder"), QString::fromStdString(folderId));
    return decodePayload<IgnorePatterns>(get(path, query), path);
}

std::vector<ServiceEvent> HttpApiClient::fetchEvents(std::int64_t sinceId,
                                                     int limit,
                                                     const CancellationToken &token)
{
    const QString path = QStringLiteral("/rest/events");
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("since"), QString::number(sinceId));
    query.addQueryItem(QStringLiteral("timeout"), QString::number(kEventsLongPollSeconds));
    if (limit > 0) {
        query.addQueryItem(QStringLiteral("limit"), QString::number(limit));
    }

    const QByteArray body = execute(Verb::Get, path, query, kEventsRequestTimeout, token);
    return decodePayload<std::vector<ServiceEvent>>(body, path);
}

void HttpApiClient::scan(const std::string &folderId, const std::string &subPath)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("folder"), QString::fromStdString(folderId));
    if (!subPath.empty()) {
        query.addQueryItem(QStringLiteral("sub"), QString::fromStdString(subPath));
    }
    post(QStringLiteral("/rest/db/scan"), query);
}

void HttpApiClient::restart()
{
    post(QStringLiteral("/rest/system/restart"));
}

void HttpApiClient::shutdown()
{
    post(QStringLiteral("/rest/system/shutdown"));
}

void HttpApiClient::ping(std::chrono::milliseconds timeout, const CancellationToken &token)
{
    execute(Verb::Get, QStringLiteral("/rest/system/ping"), QUrlQuery(), timeout, token);
}

QByteArray HttpApiClient::get(const QString &path, const QUrlQuery &query)
{
    return execute(Verb::Get, path, query, m_requestTimeout, CancellationToken());
}

void HttpApiClient::post(const QString &path, const QUrlQuery &query)
{
    execute(Verb::Post, path, query, m_requestTimeout, CancellationToken());
}

QByteArray HttpApiClient::execute(Verb verb,
                                  const QString &path,
                                  const QUrlQuery &query,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken &token)
{
    token.throwIfCancellationRequested();

    QUrl url = m_baseUrl;
    url.setPath(path);
    url.setQuery(query);

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setRawHeader("X-API-Key", m_apiKey.toUtf8());

    QNetworkReply *reply = nullptr;
    if (verb == Verb::Post) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
        reply = manager.post(request, QByteArray());
    } else {
        reply = manager.get(request);
    }

    // Blocking call: spin a local loop until the reply finishes, the deadline
    // passes or the token is cancelled.
    QEventLoop loop;
    bool timedOut = false;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, reply, [&timedOut, reply]() {
        timedOut = true;
        reply->abort();
    });

    QTimer cancelPoll;
    cancelPoll.setInterval(static_cast<int>(kCancelPollInterval.count()));
    QObject::connect(&cancelPoll, &QTimer::timeout, reply, [&token, reply]() {
        if (token.isCancellationRequested()) {
            reply->abort();
        }
    });

    deadline.start(static_cast<int>(timeout.count()));
    cancelPoll.start();
    if (!reply->isFinished()) {
        loop.exec();
    }
    deadline.stop();
    cancelPoll.stop();

    token.throwIfCancellationRequested();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (timedOut) {
        throw ApiError("request to " + path.toStdString() + " timed out");
    }
    if (reply->error() != QNetworkReply::NoError) {
        SWLOG_DEBUG(kComponent,
                    QStringLiteral("execute"),
                    QStringLiteral("api_request_failed"),
                    QStringLiteral("network_error"),
                    QStringLiteral("http"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", path.toStdString()},
                                   {"status", status},
                                   {"error", reply->errorString().toStdString()}});
        throw ApiError(path.toStdString() + ": " + reply->errorString().toStdString(), status);
    }
    if (status >= 400) {
        throw ApiError(path.toStdString() + ": HTTP " + std::to_string(status), status);
    }

    return reply->readAll();
}

std::shared_ptr<ApiClient> HttpApiClientFactory::createClient(const QUrl &address,
                                                              const QString &apiKey,
                                                              std::chrono::milliseconds connectTimeout,
                                                              const CancellationToken &token)
{
    auto client = std::make_shared<HttpApiClient>(address, apiKey);

    QElapsedTimer elapsed;
    elapsed.start();
    int attempts = 0;

    for (;;) {
        token.throwIfCancellationRequested();

        const std::chrono::milliseconds remaining =
            connectTimeout - std::chrono::milliseconds(elapsed.elapsed());
        if (remaining.count() <= 0) {
            SWLOG_WARN(kComponent,
                       QStringLiteral("createClient"),
                       QStringLiteral("api_connect_timeout"),
                       QStringLiteral("ping_unanswered"),
                       QStringLiteral("ping_retry"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"address", address.toString().toStdString()},
                                      {"attempts", attempts}});
            throw ApiError("service API at " + address.toString().toStdString()
                           + " did not answer in time");
        }

        try {
            ++attempts;
            client->ping(std::min(remaining, kPingTimeout), token);
            SWLOG_INFO(kComponent,
                       QStringLiteral("createClient"),
                       QStringLiteral("api_connected"),
                       QStringLiteral("ping_answered"),
                       QStringLiteral("ping_retry"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"address", address.toString().toStdString()},
                                      {"attempts", attempts}});
            return client;
        } catch (const ApiError &) {
            // Not listening yet.
        }

        if (token.waitFor(kPingRetryDelay)) {
            throw OperationCancelledError();
        }
    }
}

} // namespace syncwarden
