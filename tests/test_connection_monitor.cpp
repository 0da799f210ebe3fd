/*
 *  test_connection_monitor.cpp - Network stats, quality scoring and the monitor
 *
 *  Drives quality::ConnectionMonitor from a ManualLoop with scripted
 *  transport counters and checks the derived stats, scores, categories
 *  and change notifications.
 */

#include <stdio.h>

#include <chrono>
#include <optional>
#include <vector>

#include "event/event_loop.h"
#include "quality/connection_monitor.h"
#include "quality/network_stats.h"

static int failures = 0;

static void check(bool ok, const char *what)
{
	printf("  %s: %s\n", ok ? "ok  " : "FAIL", what);
	if (!ok) failures++;
}

static quality::QualityMetrics metrics_with_score(int score)
{
	quality::QualityMetrics m;
	m.score = score;
	m.category = quality::category_for_score(score);
	return m;
}

static void test_scoring()
{
	printf("\n=== Scoring ===\n");
	using namespace quality;

	NetworkStats clean;
	clean.bandwidth_bps = 2000000;
	QualityMetrics m = score_quality(clean);
	check(m.score == 100 && m.category == QualityCategory::Excellent && m.issues.empty(), "clean link scores 100");

	NetworkStats bad;
	bad.packet_loss_rate = 6.0;
	bad.round_trip_ms = 350;
	bad.jitter_ms = 60;
	bad.bandwidth_bps = 100000;
	m = score_quality(bad);
	check(m.score == 0 && m.category == QualityCategory::Poor, "every deduction clamps at 0");
	check(has_issue(m, ISSUE_HIGH_LOSS) && has_issue(m, ISSUE_HIGH_LATENCY) &&
	      has_issue(m, ISSUE_HIGH_JITTER) && has_issue(m, ISSUE_LOW_BANDWIDTH), "all issues listed");

	NetworkStats moderate;
	moderate.packet_loss_rate = 3.0;       // -20
	moderate.round_trip_ms = 120;          // -5
	moderate.bandwidth_bps = 1000000;
	m = score_quality(moderate);
	check(m.score == 75 && m.category == QualityCategory::Good, "moderate loss + minor latency is good (75)");

	NetworkStats edge;
	edge.packet_loss_rate = 5.0;           // not above 5: -20
	edge.round_trip_ms = 300;              // not above 300: -15
	edge.jitter_ms = 30;                   // not above 30: 0
	edge.bandwidth_bps = 500000;           // not below 500k: 0
	m = score_quality(edge);
	check(m.score == 65 && m.category == QualityCategory::Fair, "thresholds are strict (65, fair)");

	check(category_for_score(85) == QualityCategory::Excellent, "85 is excellent");
	check(category_for_score(84) == QualityCategory::Good, "84 is good");
	check(category_for_score(70) == QualityCategory::Good, "70 is good");
	check(category_for_score(50) == QualityCategory::Fair, "50 is fair");
	check(category_for_score(49) == QualityCategory::Poor, "49 is poor");
}

static void test_compute_stats()
{
	printf("\n=== Interval stats ===\n");
	using namespace quality;

	auto now = std::chrono::steady_clock::now();

	TransportCounters first;
	first.packets_received = 100;
	first.packets_lost = 0;
	NetworkStats s = compute_stats(first, nullptr, 0.0, now);
	check(s.bandwidth_bps == 0.0 && s.packet_loss_rate == 0.0, "first sample has no bandwidth");

	TransportCounters second;
	second.bytes_sent = 125000;
	second.packets_received = 196;
	second.packets_lost = 4;
	second.round_trip_ms = 42;
	s = compute_stats(second, &first, 1000.0, now);
	check(s.bandwidth_bps == 1000000.0, "125000 bytes in one second is 1 Mbps");
	check(s.packet_loss_rate == 4.0, "4 lost of 100 in the interval is 4%");
	check(s.round_trip_ms == 42, "round trip copied from the counters");

	TransportCounters reset;
	reset.bytes_sent = 1000;
	s = compute_stats(reset, &second, 1000.0, now);
	check(s.bandwidth_bps == 8000.0, "counter reset counts from zero");
}

static void test_monitor_ticks()
{
	printf("\n=== Monitor ticks ===\n");
	using namespace quality;

	event::ManualLoop loop;
	TransportCounters counters;
	bool have_counters = false;

	MonitorSettings settings;
	settings.label = "peer-1";
	ConnectionMonitor monitor(loop, [&]() -> std::optional<TransportCounters> {
		if (!have_counters) return std::nullopt;
		return counters;
	}, settings);

	int stats_events = 0;
	std::vector<QualityCategory> changes;
	monitor.on_stats([&stats_events](const NetworkStats &) { stats_events++; });
	monitor.on_quality_change([&changes](const QualityMetrics &m) { changes.push_back(m.category); });

	monitor.start();
	monitor.start();
	check(loop.timer_count() == 1, "start is idempotent");

	loop.advance(std::chrono::milliseconds(1000));
	check(stats_events == 0 && !monitor.current_stats(), "no sample while the link has no stats");

	have_counters = true;
	counters.round_trip_ms = 20;
	loop.advance(std::chrono::milliseconds(1000));
	check(stats_events == 1, "first sample taken");
	check(monitor.current_quality() && monitor.current_quality()->score == 90,
	      "first sample loses 10 for unknown bandwidth");

	for (int i = 0; i < 3; i++) {
		counters.bytes_sent += 250000;
		counters.packets_received += 100;
		loop.advance(std::chrono::milliseconds(1000));
	}
	check(monitor.current_stats() && monitor.current_stats()->bandwidth_bps == 2000000.0, "2 Mbps measured");
	check(monitor.current_quality()->score == 100, "healthy link scores 100");
	check(changes.empty(), "no change while excellent");

	counters.bytes_sent += 250000;
	counters.packets_received += 90;
	counters.packets_lost += 10;
	counters.round_trip_ms = 400;
	loop.advance(std::chrono::milliseconds(1000));
	check(monitor.current_quality()->score == 30, "10% loss and 400 ms rtt scores 30");
	check(changes.size() == 1 && changes[0] == QualityCategory::Poor, "change to poor reported");

	monitor.stop();
	check(!monitor.is_running() && loop.timer_count() == 0, "stop cancels the timer");
	int before = stats_events;
	loop.advance(std::chrono::milliseconds(3000));
	check(stats_events == before, "no samples after stop");
}

static void test_single_change()
{
	printf("\n=== Scores 90, 88, 40 ===\n");
	using namespace quality;

	event::ManualLoop loop;
	ConnectionMonitor monitor(loop, nullptr);

	int changes = 0;
	QualityCategory last = QualityCategory::Excellent;
	monitor.on_quality_change([&](const QualityMetrics &m) {
		changes++;
		last = m.category;
	});

	NetworkStats stats;
	monitor.publish_sample(stats, metrics_with_score(90));
	monitor.publish_sample(stats, metrics_with_score(88));
	check(changes == 0, "90 then 88 stays excellent");
	monitor.publish_sample(stats, metrics_with_score(40));
	check(changes == 1 && last == QualityCategory::Poor, "exactly one change, into poor");

	auto average = monitor.average_quality();
	check(average && average->score == 73 && average->category == QualityCategory::Good,
	      "average of 90, 88, 40 is 73 (good)");
}

static void test_history_window()
{
	printf("\n=== History window ===\n");
	using namespace quality;

	event::ManualLoop loop;
	MonitorSettings settings;
	settings.history_size = 3;
	ConnectionMonitor monitor(loop, nullptr, settings);

	NetworkStats stats;
	monitor.publish_sample(stats, metrics_with_score(10));
	for (int i = 0; i < 3; i++) {
		monitor.publish_sample(stats, metrics_with_score(100));
	}
	check(monitor.history().size() == 3, "history bounded");
	check(monitor.average_quality()->score == 100, "old samples leave the average");

	int changes = 0;
	monitor.on_quality_change([&changes](const QualityMetrics &) { changes++; });
	monitor.destroy();
	monitor.publish_sample(stats, metrics_with_score(0));
	check(changes == 0, "destroy drops the listeners");
	check(monitor.history().size() == 3, "window stays bounded");
}

int main()
{
	printf("=== test_connection_monitor - link quality ===\n");

	test_scoring();
	test_compute_stats();
	test_monitor_ticks();
	test_single_change();
	test_history_window();

	bool passed = failures == 0;
	if (passed) {
		printf("\n*** PASS: connection monitor ***\n");
	} else {
		printf("\n*** FAIL: %d check(s) failed ***\n", failures);
	}
	return passed ? 0 : 1;
}
