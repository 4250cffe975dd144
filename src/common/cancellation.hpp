#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace syncwarden {

class CancellationToken {
public:
    // A default token is never cancelled.
    CancellationToken() = default;

    bool isCancellationRequested() const;
    void throwIfCancellationRequested() const;

    // Sleeps for up to duration. Returns true as soon as cancellation is seen.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag);

    std::shared_ptr<const std::atomic<bool>> m_flag;
};

// Owner side of a cancellation flag shared with any number of tokens.
class CancellationSource {
public:
    CancellationSource();

    void cancel();
    bool isCancellationRequested() const;
    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace syncwarden
