/*
 * Connection Quality Monitor Implementation
 */

#include "connection_monitor.h"
#include <cmath>
#include <cstdio>
#include <exception>

namespace quality {

ConnectionMonitor::ConnectionMonitor(event::Loop& loop, CounterSource source, MonitorSettings settings)
    : loop_(loop)
    , source_(std::move(source))
    , settings_(std::move(settings))
{
    if (settings_.history_size == 0) {
        settings_.history_size = 1;
    }
}

ConnectionMonitor::~ConnectionMonitor() {
    stop();
}

void ConnectionMonitor::start() {
    if (timer_id_ != 0) {
        return;
    }
    timer_id_ = loop_.schedule_every(settings_.interval, [this]() { sample(); });
}

void ConnectionMonitor::stop() {
    if (timer_id_ == 0) {
        return;
    }
    loop_.cancel(timer_id_);
    timer_id_ = 0;
}

void ConnectionMonitor::destroy() {
    stop();
    stats_listeners_.clear();
    quality_listeners_.clear();
    change_listeners_.clear();
}

void ConnectionMonitor::sample() {
    if (!source_) {
        return;
    }

    std::optional<TransportCounters> counters;
    try {
        counters = source_();
    } catch (const std::exception& e) {
        fprintf(stderr, "[Quality] Failed to collect stats for %s: %s\n",
                settings_.label.c_str(), e.what());
        return;
    }
    if (!counters) {
        return;
    }

    auto now = loop_.now();
    double elapsed_ms = 0.0;
    if (previous_stats_) {
        elapsed_ms = std::chrono::duration<double, std::milli>(now - previous_stats_->timestamp).count();
    }

    NetworkStats stats = compute_stats(*counters,
                                       previous_counters_ ? &*previous_counters_ : nullptr,
                                       elapsed_ms, now);
    previous_counters_ = counters;

    QualityMetrics metrics = score_quality(stats);

    if (settings_.debug) {
        fprintf(stderr, "[Quality] %s: loss=%.2f%% rtt=%.0fms jitter=%.1fms bw=%.0fkbps score=%d (%s)\n",
                settings_.label.c_str(), stats.packet_loss_rate, stats.round_trip_ms,
                stats.jitter_ms, stats.bandwidth_bps / 1000.0, metrics.score,
                category_name(metrics.category));
    }

    publish_sample(stats, metrics);
}

void ConnectionMonitor::publish_sample(const NetworkStats& stats, const QualityMetrics& metrics) {
    previous_stats_ = stats;

    history_.push_back(metrics);
    while (history_.size() > settings_.history_size) {
        history_.pop_front();
    }

    // Listeners may stop or destroy the monitor; iterate over copies
    auto stats_listeners = stats_listeners_;
    for (auto& listener : stats_listeners) {
        listener(stats);
    }

    auto quality_listeners = quality_listeners_;
    for (auto& listener : quality_listeners) {
        listener(metrics);
    }

    if (quality_changed()) {
        auto change_listeners = change_listeners_;
        for (auto& listener : change_listeners) {
            listener(metrics);
        }
    }
}

bool ConnectionMonitor::quality_changed() const {
    if (history_.size() < 2) {
        return false;
    }
    return history_[history_.size() - 1].category != history_[history_.size() - 2].category;
}

std::optional<NetworkStats> ConnectionMonitor::current_stats() const {
    return previous_stats_;
}

std::optional<QualityMetrics> ConnectionMonitor::current_quality() const {
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

std::optional<QualityMetrics> ConnectionMonitor::average_quality() const {
    if (history_.empty()) {
        return std::nullopt;
    }

    double total = 0.0;
    QualityMetrics average;
    for (const auto& metrics : history_) {
        total += metrics.score;
        for (const auto& issue : metrics.issues) {
            if (!has_issue(average, issue.c_str())) {
                average.issues.push_back(issue);
            }
        }
    }

    double mean = total / history_.size();
    // Category comes from the unrounded mean; thresholds are integers so floor is exact
    average.category = category_for_score(static_cast<int>(std::floor(mean)));
    average.score = static_cast<int>(std::lround(mean));
    return average;
}

} // namespace quality
