/*
 * Connection Quality Monitor
 *
 * Samples one link's transport counters on a repeating loop timer,
 * derives NetworkStats and QualityMetrics for each tick, and notifies
 * listeners. A "quality changed" notification fires when the category of
 * the newest sample differs from the one before it.
 */

#ifndef CONNECTION_MONITOR_H
#define CONNECTION_MONITOR_H

#include "network_stats.h"
#include "../event/event_loop.h"
#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace quality {

struct MonitorSettings {
    std::chrono::milliseconds interval{1000};
    size_t history_size = 10;
    bool debug = false;          // log every tick
    std::string label;           // link id, for log lines
};

class ConnectionMonitor {
public:
    // Returns nullopt while the link has no media statistics to report
    using CounterSource = std::function<std::optional<TransportCounters>()>;
    using StatsListener = std::function<void(const NetworkStats&)>;
    using QualityListener = std::function<void(const QualityMetrics&)>;

    ConnectionMonitor(event::Loop& loop, CounterSource source, MonitorSettings settings = MonitorSettings());
    ~ConnectionMonitor();

    ConnectionMonitor(const ConnectionMonitor&) = delete;
    ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;

    // Start/stop the sampling timer. Both are idempotent.
    void start();
    void stop();
    bool is_running() const { return timer_id_ != 0; }

    // Take one sample now (what the timer calls)
    void sample();

    // Record an externally computed sample and notify listeners
    void publish_sample(const NetworkStats& stats, const QualityMetrics& metrics);

    // Listeners are called in order: stats, quality, quality change
    void on_stats(StatsListener listener) { stats_listeners_.push_back(std::move(listener)); }
    void on_quality(QualityListener listener) { quality_listeners_.push_back(std::move(listener)); }
    void on_quality_change(QualityListener listener) { change_listeners_.push_back(std::move(listener)); }

    // Stop sampling and drop every listener
    void destroy();

    std::optional<NetworkStats> current_stats() const;
    std::optional<QualityMetrics> current_quality() const;

    // Mean score over the retained window (rounded), union of issues
    std::optional<QualityMetrics> average_quality() const;

    const std::deque<QualityMetrics>& history() const { return history_; }

private:
    bool quality_changed() const;

    event::Loop& loop_;
    CounterSource source_;
    MonitorSettings settings_;
    event::TimerId timer_id_ = 0;

    std::optional<TransportCounters> previous_counters_;
    std::optional<NetworkStats> previous_stats_;
    std::deque<QualityMetrics> history_;

    std::vector<StatsListener> stats_listeners_;
    std::vector<QualityListener> quality_listeners_;
    std::vector<QualityListener> change_listeners_;
};

} // namespace quality

#endif // CONNECTION_MONITOR_H
