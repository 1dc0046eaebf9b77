#include "metrics_collector.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

auto MetricsCollector::recordMetric(const std::string &name, const std::string &value) -> void {
    std::lock_guard lock(m_metrics_mutex);
    m_metrics.push_back({name, value, std::chrono::system_clock::now()});
}

auto MetricsCollector::pending(const std::string &name) const -> std::size_t {
    std::lock_guard lock(m_metrics_mutex);
    return static_cast<std::size_t>(std::count_if(m_metrics.begin(), m_metrics.end(),
        [&name](const Metric &metric) { return metric.name == name; }));
}

auto MetricsCollector::collect() -> std::size_t {
    std::lock_guard lock(m_metrics_mutex);
    for (const auto &metric : m_metrics) {
        spdlog::debug("metric {}: {}", metric.name, metric.value);
    }
    const auto collected = m_metrics.size();
    m_metrics.clear();
    return collected;
}
