#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <functional>
#include <utility>

// Set by the transport when the caller goes away. Either flip it with
// Cancel() or hand it a probe that asks the transport directly.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> probe) : probe_(std::move(probe)) {}

    void Cancel() { cancelled_.store(true); }

    bool IsCancelled() const {
        return cancelled_.load() || (probe_ && probe_());
    }

private:
    std::atomic<bool> cancelled_{false};
    std::function<bool()> probe_;
};

#endif // CANCELLATION_HPP
