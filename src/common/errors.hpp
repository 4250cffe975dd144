#pragma once

#include <QFuture>
#include <QUnhandledException>

#include <exception>
#include <stdexcept>
#include <string>

namespace syncwarden {

// Raised when the connection attempt an operation belongs to was aborted.
class OperationCancelledError : public std::runtime_error {
public:
    OperationCancelledError()
        : std::runtime_error("operation cancelled")
    {
    }
};

// Transport, HTTP status or payload failure talking to the service API.
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string &message, int httpStatus = 0)
        : std::runtime_error(message)
        , m_httpStatus(httpStatus)
    {
    }

    int httpStatus() const { return m_httpStatus; }

private:
    int m_httpStatus;
};

// QtConcurrent wraps non-QException exceptions; hand callers the original one.
template <typename T>
T takeResult(QFuture<T> &future)
{
    try {
        future.waitForFinished();
        return future.result();
    } catch (const QUnhandledException &ex) {
        if (ex.exception()) {
            std::rethrow_exception(ex.exception());
        }
        throw;
    }
}

inline void waitForCompletion(QFuture<void> &future)
{
    try {
        future.waitForFinished();
    } catch (const QUnhandledException &ex) {
        if (ex.exception()) {
            std::rethrow_exception(ex.exception());
        }
        throw;
    }
}

} // namespace syncwarden
