#ifndef READINESS_PROBER_HPP
#define READINESS_PROBER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include "configuration.hpp"
#include "http_client.hpp"

enum class PollOutcome {
    SUCCEEDED,
    TIMED_OUT,
    CANCELLED
};

/// @brief Run probe every interval until it returns true or the deadline passes
///
/// The probe always runs at least once. The stop flag, when given, is checked
/// between attempts and cancels the wait.
PollOutcome pollWithDeadline(const std::function<bool()>& probe,
                             std::chrono::milliseconds timeout,
                             std::chrono::milliseconds interval,
                             const std::atomic<bool>* stop = nullptr);

enum class Readiness {
    READY,
    TIMED_OUT
};

/// Waits for an instance's API to answer. Uses unauthenticated GET /api/auth:
/// any answer below 500 means FTL is serving requests again.
class ReadinessProber {
public:
    explicit ReadinessProber(std::shared_ptr<http::Client> client,
                             std::chrono::milliseconds interval = std::chrono::seconds(1));
    virtual ~ReadinessProber() = default;

    virtual Readiness waitReady(const InstanceConfig& instance,
                                std::chrono::milliseconds timeout,
                                const std::atomic<bool>* stop = nullptr) const;

    /// Like waitReady, but a timeout or a stop request throws ReadinessTimeout
    void requireReady(const InstanceConfig& instance,
                      std::chrono::milliseconds timeout,
                      const std::atomic<bool>* stop = nullptr) const;

    /// One probe; transport failures count as "not ready"
    bool probeOnce(const InstanceConfig& instance) const;

private:
    std::shared_ptr<http::Client> m_client;
    std::chrono::milliseconds m_interval;
};

#endif // READINESS_PROBER_HPP
