#ifndef METRICS_COLLECTOR_HPP
#define METRICS_COLLECTOR_HPP


#include <chrono>
#include <mutex>
#include <string>
#include <vector>


/// Named per-cycle measurements, reported through the logger
class MetricsCollector {
private:
    struct Metric {
        std::string name;
        std::string value;
        std::chrono::system_clock::time_point timestamp;
    };

    std::vector<Metric> m_metrics;
    mutable std::mutex m_metrics_mutex;



public:

    void recordMetric(const std::string& name, const std::string& value);

    /// Number of recorded, not yet collected, metrics with this name
    std::size_t pending(const std::string& name) const;

    /// Log every pending metric at debug level and clear them.
    /// @return number of metrics collected
    std::size_t collect();

};



#endif //METRICS_COLLECTOR_HPP
