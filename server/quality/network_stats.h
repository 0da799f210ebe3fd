/*
 * Network Statistics and Quality Scoring
 *
 * Per-link transport counters, the per-tick NetworkStats derived from two
 * successive samples, and the deduction-based quality score computed from
 * a single NetworkStats.
 */

#ifndef NETWORK_STATS_H
#define NETWORK_STATS_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace quality {

/**
 * Cumulative counters read from a link's transport
 *
 * Byte/packet counts only ever grow for the life of a link. Jitter and
 * round-trip time are instantaneous values from the latest RTCP report.
 */
struct TransportCounters {
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t packets_received = 0;
    uint64_t packets_lost = 0;
    double jitter_ms = 0.0;
    double round_trip_ms = 0.0;
};

struct NetworkStats {
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t packets_received = 0;
    uint64_t packets_lost = 0;
    double packet_loss_rate = 0.0;   // percent, over the last interval
    double jitter_ms = 0.0;
    double round_trip_ms = 0.0;
    double bandwidth_bps = 0.0;      // bits/sec, sent + received, over the last interval (0 on the first tick)
    std::chrono::steady_clock::time_point timestamp;
};

enum class QualityCategory {
    Excellent,
    Good,
    Fair,
    Poor
};

struct QualityMetrics {
    int score = 100;
    QualityCategory category = QualityCategory::Excellent;
    std::vector<std::string> issues;
};

// Issue names reported in QualityMetrics::issues
extern const char* const ISSUE_HIGH_LOSS;
extern const char* const ISSUE_MODERATE_LOSS;
extern const char* const ISSUE_MINOR_LOSS;
extern const char* const ISSUE_HIGH_LATENCY;
extern const char* const ISSUE_MODERATE_LATENCY;
extern const char* const ISSUE_MINOR_LATENCY;
extern const char* const ISSUE_HIGH_JITTER;
extern const char* const ISSUE_MODERATE_JITTER;
extern const char* const ISSUE_LOW_BANDWIDTH;

/**
 * Derive stats for one interval
 * @param previous Counters from the previous tick (nullptr on the first tick)
 * @param elapsed_ms Time between the two samples; rates are zero when <= 0
 */
NetworkStats compute_stats(const TransportCounters& current,
                           const TransportCounters* previous,
                           double elapsed_ms,
                           std::chrono::steady_clock::time_point timestamp);

// Score a sample: deductions from 100, clamped to [0, 100]
QualityMetrics score_quality(const NetworkStats& stats);

QualityCategory category_for_score(int score);

const char* category_name(QualityCategory category);

bool has_issue(const QualityMetrics& metrics, const char* issue);

} // namespace quality

#endif // NETWORK_STATS_H
