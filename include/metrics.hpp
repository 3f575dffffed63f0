#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace erebus {

using MetricLabels = std::map<std::string, std::string>;

// Process-wide counters and gauges, exported on /metrics in Prometheus text format.
// A metric name is a family; each distinct label set is its own series.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Optional "# HELP" line for a family.
    void describe(const std::string& name, const std::string& help) {
        std::lock_guard<std::mutex> lock(mutex_);
        help_[name] = help;
    }

    void increment_counter(const std::string& name, double value = 1.0, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][format_labels(labels)] += value;
    }

    // Sum over every series of the family.
    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum(counters_, name);
    }

    double get_counter(const std::string& name, const MetricLabels& labels) {
        std::lock_guard<std::mutex> lock(mutex_);
        return series(counters_, name, labels);
    }

    void set_gauge(const std::string& name, double value, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][format_labels(labels)] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][format_labels(labels)] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][format_labels(labels)] -= value;
    }

    double get_gauge(const std::string& name, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return series(gauges_, name, labels);
    }

    // Drops every series. Descriptions survive.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        write_families(ss, counters_, "counter");
        write_families(ss, gauges_, "gauge");
        return ss.str();
    }

private:
    using Family = std::map<std::string, double>;  // rendered label set -> value
    using Families = std::map<std::string, Family>;

    MetricsRegistry() = default;

    static std::string format_labels(const MetricLabels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) out += ",";
            first = false;
            out += k + "=\"";
            for (char c : v) {
                if (c == '\\' || c == '"') out += '\\';
                if (c == '\n') {
                    out += "\\n";
                    continue;
                }
                out += c;
            }
            out += "\"";
        }
        return out + "}";
    }

    static double sum(const Families& families, const std::string& name) {
        auto it = families.find(name);
        if (it == families.end()) return 0.0;
        double total = 0.0;
        for (const auto& [labels, val] : it->second) total += val;
        return total;
    }

    static double series(const Families& families, const std::string& name, const MetricLabels& labels) {
        auto it = families.find(name);
        if (it == families.end()) return 0.0;
        auto s = it->second.find(format_labels(labels));
        return s != it->second.end() ? s->second : 0.0;
    }

    void write_families(std::stringstream& ss, const Families& families, const char* type) const {
        for (const auto& [name, family] : families) {
            if (auto h = help_.find(name); h != help_.end()) {
                ss << "# HELP " << name << " " << h->second << "\n";
            }
            ss << "# TYPE " << name << " " << type << "\n";
            for (const auto& [labels, val] : family) {
                ss << name << labels << " " << val << "\n";
            }
        }
    }

    Families counters_;
    Families gauges_;
    std::map<std::string, std::string> help_;
    std::mutex mutex_;
};

}
