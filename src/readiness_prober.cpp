#include "readiness_prober.hpp"
#include "session_manager.hpp"
#include "sync_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace {

// Sleep in short slices so that a stop request is honoured promptly.
constexpr std::chrono::milliseconds STOP_CHECK_SLICE{50};

bool stopRequested(const std::atomic<bool>* stop) {
    return stop != nullptr && stop->load();
}

} // namespace

PollOutcome pollWithDeadline(const std::function<bool()>& probe,
                             std::chrono::milliseconds timeout,
                             std::chrono::milliseconds interval,
                             const std::atomic<bool>* stop) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (stopRequested(stop)) {
            return PollOutcome::CANCELLED;
        }
        if (probe()) {
            return PollOutcome::SUCCEEDED;
        }

        const auto nextAttempt = std::chrono::steady_clock::now() + interval;
        if (nextAttempt > deadline) {
            return PollOutcome::TIMED_OUT;
        }
        while (std::chrono::steady_clock::now() < nextAttempt) {
            if (stopRequested(stop)) {
                return PollOutcome::CANCELLED;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                nextAttempt - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::max(std::chrono::milliseconds(0), std::min(remaining, STOP_CHECK_SLICE)));
        }
    }
}

ReadinessProber::ReadinessProber(std::shared_ptr<http::Client> client, std::chrono::milliseconds interval)
    : m_client(std::move(client)), m_interval(interval) {}

bool ReadinessProber::probeOnce(const InstanceConfig& instance) const {
    try {
        const auto response = m_client->send(endpointFor(instance), http::Request{http::Method::GET, "/api/auth", {}, {}, {}});
        return response.status > 0 && response.status < 500;
    } catch (const SyncError& e) {
        spdlog::debug("[{}] not ready: {}", instance.label(), e.what());
        return false;
    }
}

Readiness ReadinessProber::waitReady(const InstanceConfig& instance,
                                     std::chrono::milliseconds timeout,
                                     const std::atomic<bool>* stop) const {
    spdlog::debug("[{}] waiting up to {}ms for the API to become ready", instance.label(), timeout.count());

    const auto outcome = pollWithDeadline([&] { return probeOnce(instance); }, timeout, m_interval, stop);
    if (outcome == PollOutcome::SUCCEEDED) {
        return Readiness::READY;
    }
    if (outcome == PollOutcome::TIMED_OUT) {
        spdlog::warn("[{}] API not ready after {}ms", instance.label(), timeout.count());
    }
    return Readiness::TIMED_OUT;
}

void ReadinessProber::requireReady(const InstanceConfig& instance,
                                   std::chrono::milliseconds timeout,
                                   const std::atomic<bool>* stop) const {
    if (waitReady(instance, timeout, stop) != Readiness::READY) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        throw ReadinessTimeout("[" + instance.label() + "] API not ready after " + std::to_string(seconds) + "s");
    }
}
