/// @file cache_metrics.cpp
/// @brief In-memory implementation of CacheMetrics.

#include "rcache/foundation/cache_metrics.hpp"

#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <utility>

namespace rcache::foundation {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

struct Series {
    std::string name;
    MetricLabels labels;
    double value{0.0};
    bool counter{false};
};

// Render labels as {k="v",...}; empty label sets render as "".
std::string formatLabels(const MetricLabels& labels) {
    if (labels.empty()) {
        return {};
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [key, val] : labels) {
        if (!first) {
            out += ',';
        }
        out += key;
        out += "=\"";
        for (char c : val) {
            if (c == '"' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        out += '"';
        first = false;
    }
    out += '}';
    return out;
}

// (name, rendered labels): keeps every series of one metric adjacent.
using SeriesKey = std::pair<std::string, std::string>;

SeriesKey seriesKey(std::string_view name, const MetricLabels& labels) {
    return {std::string(name), formatLabels(labels)};
}

// Format a double for Prometheus output, removing unnecessary trailing zeros.
std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct CacheMetrics::Impl {
    mutable std::mutex mutex;
    // Ordered so scrape() output is stable and grouped by metric name.
    std::map<SeriesKey, Series> series;
};

// ── Construction / destruction / move ───────────────────────────────────────

CacheMetrics::CacheMetrics() : impl_(std::make_unique<Impl>()) {}

CacheMetrics::~CacheMetrics() = default;

CacheMetrics::CacheMetrics(CacheMetrics&&) noexcept = default;

CacheMetrics& CacheMetrics::operator=(CacheMetrics&&) noexcept = default;

// ── Recording ───────────────────────────────────────────────────────────────

void CacheMetrics::record(std::string_view name, double value,
                          const MetricLabels& labels) {
    auto key = seriesKey(name, labels);
    bool counter = isCounterMetric(name);

    std::lock_guard lock(impl_->mutex);
    auto [it, inserted] = impl_->series.try_emplace(key);
    if (inserted) {
        it->second.name = std::string(name);
        it->second.labels = labels;
        it->second.counter = counter;
    }
    if (counter) {
        it->second.value += value;
    } else {
        it->second.value = value;
    }
}

// ── Queries ─────────────────────────────────────────────────────────────────

double CacheMetrics::counterValue(std::string_view name,
                                  const MetricLabels& labels) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->series.find(seriesKey(name, labels));
    if (it == impl_->series.end() || !it->second.counter) {
        return 0.0;
    }
    return it->second.value;
}

double CacheMetrics::counterTotal(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    double total = 0.0;
    for (const auto& [_, s] : impl_->series) {
        if (s.counter && s.name == name) {
            total += s.value;
        }
    }
    return total;
}

double CacheMetrics::gaugeValue(std::string_view name,
                                const MetricLabels& labels) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->series.find(seriesKey(name, labels));
    if (it == impl_->series.end() || it->second.counter) {
        return 0.0;
    }
    return it->second.value;
}

std::size_t CacheMetrics::seriesCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->series.size();
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string CacheMetrics::scrape() const {
    std::ostringstream out;
    std::set<std::string> typed;

    std::lock_guard lock(impl_->mutex);
    for (const auto& [key, s] : impl_->series) {
        if (typed.insert(s.name).second) {
            out << "# TYPE " << s.name << (s.counter ? " counter\n" : " gauge\n");
        }
        out << key.first << key.second << " " << formatDouble(s.value) << "\n";
    }
    return out.str();
}

// ── Reset ───────────────────────────────────────────────────────────────────

void CacheMetrics::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->series.clear();
}

}  // namespace rcache::foundation
