#pragma once

#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace auvctl {

// Process-wide counters and gauges, exported in Prometheus text format.
// A metric family may carry labelled series, e.g.
// gateway_rejected_total{category="xss"}; the unlabelled series of a family
// is the one with an empty label set.
class MetricsRegistry {
public:
    using Labels = std::map<std::string, std::string>;

    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Counters only increase; negative increments are ignored.
    void increment_counter(const std::string& name, double value = 1.0) {
        increment_counter(name, Labels{}, value);
    }

    void increment_counter(const std::string& name, const Labels& labels, double value = 1.0) {
        if (value < 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][render_labels(labels)] += value;
    }

    double get_counter(const std::string& name, const Labels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(counters_, name, labels);
    }

    // Sum over every series of a counter family.
    double get_counter_total(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        double total = 0.0;
        auto family = counters_.find(name);
        if (family != counters_.end()) {
            for (const auto& series : family->second) total += series.second;
        }
        return total;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(gauges_, name, Labels{});
    }

    // Drops every series. Intended for tests.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Text exposition format 0.0.4: one TYPE line per family followed by
     * its series, families in name order.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream ss;
        write_families(ss, counters_, "counter");
        write_families(ss, gauges_, "gauge");
        return ss.str();
    }

private:
    // family name -> rendered label set -> value
    using Families = std::map<std::string, std::map<std::string, double>>;

    MetricsRegistry() = default;

    static double lookup(const Families& families, const std::string& name, const Labels& labels) {
        auto family = families.find(name);
        if (family == families.end()) return 0.0;
        auto series = family->second.find(render_labels(labels));
        return (series != family->second.end()) ? series->second : 0.0;
    }

    // Renders {k="v",...} with keys in sorted order; backslash, quote and
    // newline in values are escaped.
    static std::string render_labels(const Labels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        bool first = true;
        for (const auto& [key, value] : labels) {
            if (!first) out += ",";
            first = false;
            out += key + "=\"";
            for (char c : value) {
                if (c == '\\') out += "\\\\";
                else if (c == '"') out += "\\\"";
                else if (c == '\n') out += "\\n";
                else out += c;
            }
            out += "\"";
        }
        out += "}";
        return out;
    }

    static void write_families(std::ostringstream& ss, const Families& families, const char* type) {
        for (const auto& [name, series] : families) {
            ss << "# TYPE " << name << " " << type << "\n";
            for (const auto& [labels, val] : series) {
                ss << name << labels << " " << val << "\n";
            }
        }
    }

    Families counters_;
    Families gauges_;
    std::mutex mutex_;
};

}
