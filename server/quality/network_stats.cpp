/*
 * Network Statistics and Quality Scoring Implementation
 */

#include "network_stats.h"
#include <algorithm>

namespace quality {

const char* const ISSUE_HIGH_LOSS = "High packet loss";
const char* const ISSUE_MODERATE_LOSS = "Moderate packet loss";
const char* const ISSUE_MINOR_LOSS = "Minor packet loss";
const char* const ISSUE_HIGH_LATENCY = "High latency";
const char* const ISSUE_MODERATE_LATENCY = "Moderate latency";
const char* const ISSUE_MINOR_LATENCY = "Minor latency";
const char* const ISSUE_HIGH_JITTER = "High jitter";
const char* const ISSUE_MODERATE_JITTER = "Moderate jitter";
const char* const ISSUE_LOW_BANDWIDTH = "Low bandwidth";

// Loss and bandwidth thresholds
static const double LOSS_HIGH_PCT = 5.0;
static const double LOSS_MODERATE_PCT = 2.0;
static const double LOSS_MINOR_PCT = 0.5;
static const double RTT_HIGH_MS = 300.0;
static const double RTT_MODERATE_MS = 150.0;
static const double RTT_MINOR_MS = 100.0;
static const double JITTER_HIGH_MS = 50.0;
static const double JITTER_MODERATE_MS = 30.0;
static const double BANDWIDTH_LOW_BPS = 500000.0;

static uint64_t counter_delta(uint64_t now, uint64_t before) {
    // Counters reset when a transport is replaced; treat that as a fresh start
    return now >= before ? now - before : now;
}

NetworkStats compute_stats(const TransportCounters& current,
                           const TransportCounters* previous,
                           double elapsed_ms,
                           std::chrono::steady_clock::time_point timestamp) {
    NetworkStats stats;
    stats.bytes_sent = current.bytes_sent;
    stats.bytes_received = current.bytes_received;
    stats.packets_received = current.packets_received;
    stats.packets_lost = current.packets_lost;
    stats.jitter_ms = current.jitter_ms;
    stats.round_trip_ms = current.round_trip_ms;
    stats.timestamp = timestamp;

    // First sample: loss over the whole life of the link, no bandwidth yet
    uint64_t recv_delta = current.packets_received;
    uint64_t lost_delta = current.packets_lost;
    if (previous) {
        recv_delta = counter_delta(current.packets_received, previous->packets_received);
        lost_delta = counter_delta(current.packets_lost, previous->packets_lost);
    }
    uint64_t total = recv_delta + lost_delta;
    if (total > 0) {
        stats.packet_loss_rate = (static_cast<double>(lost_delta) / total) * 100.0;
    }

    if (previous && elapsed_ms > 0.0) {
        uint64_t bytes = counter_delta(current.bytes_received, previous->bytes_received) +
                         counter_delta(current.bytes_sent, previous->bytes_sent);
        stats.bandwidth_bps = (static_cast<double>(bytes) * 8.0 * 1000.0) / elapsed_ms;
    }

    return stats;
}

QualityMetrics score_quality(const NetworkStats& stats) {
    QualityMetrics metrics;
    int score = 100;

    if (stats.packet_loss_rate > LOSS_HIGH_PCT) {
        score -= 40;
        metrics.issues.push_back(ISSUE_HIGH_LOSS);
    } else if (stats.packet_loss_rate > LOSS_MODERATE_PCT) {
        score -= 20;
        metrics.issues.push_back(ISSUE_MODERATE_LOSS);
    } else if (stats.packet_loss_rate > LOSS_MINOR_PCT) {
        score -= 10;
        metrics.issues.push_back(ISSUE_MINOR_LOSS);
    }

    if (stats.round_trip_ms > RTT_HIGH_MS) {
        score -= 30;
        metrics.issues.push_back(ISSUE_HIGH_LATENCY);
    } else if (stats.round_trip_ms > RTT_MODERATE_MS) {
        score -= 15;
        metrics.issues.push_back(ISSUE_MODERATE_LATENCY);
    } else if (stats.round_trip_ms > RTT_MINOR_MS) {
        score -= 5;
        metrics.issues.push_back(ISSUE_MINOR_LATENCY);
    }

    if (stats.jitter_ms > JITTER_HIGH_MS) {
        score -= 20;
        metrics.issues.push_back(ISSUE_HIGH_JITTER);
    } else if (stats.jitter_ms > JITTER_MODERATE_MS) {
        score -= 10;
        metrics.issues.push_back(ISSUE_MODERATE_JITTER);
    }

    if (stats.bandwidth_bps < BANDWIDTH_LOW_BPS) {
        score -= 10;
        metrics.issues.push_back(ISSUE_LOW_BANDWIDTH);
    }

    metrics.score = std::max(0, std::min(100, score));
    metrics.category = category_for_score(metrics.score);
    return metrics;
}

QualityCategory category_for_score(int score) {
    if (score >= 85) return QualityCategory::Excellent;
    if (score >= 70) return QualityCategory::Good;
    if (score >= 50) return QualityCategory::Fair;
    return QualityCategory::Poor;
}

const char* category_name(QualityCategory category) {
    switch (category) {
        case QualityCategory::Excellent: return "excellent";
        case QualityCategory::Good:      return "good";
        case QualityCategory::Fair:      return "fair";
        case QualityCategory::Poor:      return "poor";
    }
    return "unknown";
}

bool has_issue(const QualityMetrics& metrics, const char* issue) {
    return std::find(metrics.issues.begin(), metrics.issues.end(), issue) != metrics.issues.end();
}

} // namespace quality
