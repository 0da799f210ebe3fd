/*
 *  test_adaptive_bitrate.cpp - Preset ladder and automatic adaptation
 *
 *  Feeds samples straight into the controller's monitor and checks which
 *  presets get applied: one step per adjustment, cooldown between
 *  adjustments, manual and forced presets.
 */

#include <stdio.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "event/event_loop.h"
#include "quality/adaptive_bitrate.h"

static int failures = 0;

static void check(bool ok, const char *what)
{
	printf("  %s: %s\n", ok ? "ok  " : "FAIL", what);
	if (!ok) failures++;
}

static quality::QualityMetrics metrics(int score, const char *issue = nullptr)
{
	quality::QualityMetrics m;
	m.score = score;
	m.category = quality::category_for_score(score);
	if (issue) m.issues.push_back(issue);
	return m;
}

static quality::NetworkStats bandwidth(double bps)
{
	quality::NetworkStats s;
	s.bandwidth_bps = bps;
	return s;
}

// Records every set of limits pushed to the "encoders"
struct Recorder {
	std::vector<uint32_t> video_bitrates;
	bool accept = true;

	quality::AdaptiveBitrateController::ApplyFunction apply()
	{
		return [this](const quality::EncodingLimits &limits) {
			if (!accept) return false;
			video_bitrates.push_back(limits.video.max_bitrate_bps);
			return true;
		};
	}
};

static quality::BitrateSettings settings_for(const char *preset)
{
	quality::BitrateSettings s;
	s.initial_preset = preset;
	s.cooldown = std::chrono::milliseconds(5000);
	s.label = "peer-1";
	return s;
}

static std::optional<quality::TransportCounters> no_counters()
{
	return std::nullopt;
}

static void test_ladder()
{
	printf("\n=== Preset ladder ===\n");
	using namespace quality;

	const auto &ladder = preset_ladder();
	check(std::string(ladder[0].key) == "ultra" && std::string(ladder[4].key) == "minimal", "ladder order");
	bool descending = true;
	for (size_t i = 1; i < ladder.size(); i++) {
		if (ladder[i].limits.video.max_bitrate_bps >= ladder[i - 1].limits.video.max_bitrate_bps) descending = false;
	}
	check(descending, "bitrate falls down the ladder");
	check(preset_index("medium") == 2u && !preset_index("best"), "preset lookup");

	check(preset_index_for_bandwidth(250000) == 4, "250 kbps supports minimal");
	check(preset_index_for_bandwidth(600000) == 3, "600 kbps supports low");
	check(preset_index_for_bandwidth(1000000) == 2, "1 Mbps supports medium");
	check(preset_index_for_bandwidth(2000000) == 1, "2 Mbps supports high");
	check(preset_index_for_bandwidth(5000000) == 0, "5 Mbps supports ultra");
}

static void test_bandwidth_steps()
{
	printf("\n=== Bandwidth hints ===\n");
	using namespace quality;

	event::ManualLoop loop;
	Recorder rec;
	AdaptiveBitrateController abr(loop, no_counters, rec.apply(), settings_for("high"));
	std::vector<std::string> reasons;
	abr.on_preset_change([&reasons](const QualityPreset &, const char *reason) { reasons.push_back(reason); });

	abr.start();
	check(rec.video_bitrates.size() == 1 && rec.video_bitrates[0] == 2500000, "start applies the high preset");

	abr.monitor().publish_sample(bandwidth(250000), metrics(100));
	check(std::string(abr.current_preset().key) == "high" && reasons.empty(),
	      "250 kbps on high suggests minimal, three steps away: ignored");

	abr.monitor().publish_sample(bandwidth(600000), metrics(100));
	check(std::string(abr.current_preset().key) == "high", "low is two steps away: ignored");

	abr.monitor().publish_sample(bandwidth(1000000), metrics(100));
	check(std::string(abr.current_preset().key) == "medium", "neighbouring preset applied");
	check(reasons.size() == 1 && reasons[0] == "bandwidth", "reason is bandwidth");

	abr.monitor().publish_sample(bandwidth(600000), metrics(100));
	check(std::string(abr.current_preset().key) == "medium", "no second move inside the cooldown");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(600000), metrics(100));
	check(std::string(abr.current_preset().key) == "low", "next step after the cooldown");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(2000000), metrics(100));
	check(std::string(abr.current_preset().key) == "low", "high is two steps up: ignored");

	abr.monitor().publish_sample(bandwidth(1000000), metrics(100));
	check(std::string(abr.current_preset().key) == "medium", "recovered bandwidth climbs one step");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(0), metrics(100));
	check(std::string(abr.current_preset().key) == "medium", "zero bandwidth is ignored");
	abr.stop();
}

static void test_quality_steps()
{
	printf("\n=== Quality changes ===\n");
	using namespace quality;

	event::ManualLoop loop;
	Recorder rec;
	AdaptiveBitrateController abr(loop, no_counters, rec.apply(), settings_for("high"));
	abr.start();

	abr.monitor().publish_sample(bandwidth(0), metrics(100));
	abr.monitor().publish_sample(bandwidth(0), metrics(30));
	check(abr.current_index() == 2, "poor steps down one level");

	abr.monitor().publish_sample(bandwidth(0), metrics(100));
	check(abr.current_index() == 2, "recovery inside the cooldown is ignored");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(0), metrics(60, ISSUE_HIGH_LOSS));
	check(abr.current_index() == 3, "fair with high loss steps down");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(0), metrics(95));
	check(abr.current_index() == 3, "no step up right after coming down from a higher preset");

	loop.advance(std::chrono::milliseconds(5000));
	abr.monitor().publish_sample(bandwidth(0), metrics(60));
	check(abr.current_index() == 3, "plain fair does not step down");

	// Fresh controller with no history climbs on good quality
	AdaptiveBitrateController climber(loop, no_counters, rec.apply(), settings_for("medium"));
	climber.start();
	climber.monitor().publish_sample(bandwidth(0), metrics(30));
	climber.monitor().publish_sample(bandwidth(0), metrics(75));
	check(climber.current_index() == 1, "good quality steps up one level");

	AdaptiveBitrateController top(loop, no_counters, rec.apply(), settings_for("minimal"));
	top.start();
	top.monitor().publish_sample(bandwidth(0), metrics(100));
	top.monitor().publish_sample(bandwidth(0), metrics(10));
	check(top.current_index() == 4, "nothing below minimal");
}

static void test_manual_presets()
{
	printf("\n=== Manual presets ===\n");
	using namespace quality;

	event::ManualLoop loop;
	Recorder rec;
	AdaptiveBitrateController abr(loop, no_counters, rec.apply(), settings_for("high"));
	abr.start();

	check(abr.set_preset("ultra") && abr.current_index() == 0 && abr.auto_adjust(), "set_preset keeps auto mode");
	check(abr.set_preset("minimal") && abr.current_index() == 4, "set_preset is not gated by the cooldown");
	check(!abr.set_preset("best") && abr.current_index() == 4, "unknown preset rejected");

	check(abr.force_preset("low") && !abr.auto_adjust(), "force_preset turns auto mode off");
	loop.advance(std::chrono::milliseconds(10000));
	abr.monitor().publish_sample(bandwidth(5000000), metrics(100));
	abr.monitor().publish_sample(bandwidth(5000000), metrics(20));
	check(abr.current_index() == 3, "no automatic moves while auto mode is off");

	abr.set_auto_adjust(true);
	abr.monitor().publish_sample(bandwidth(1000000), metrics(100));
	check(abr.current_index() == 2, "auto mode back on resumes adaptation");

	rec.accept = false;
	check(!abr.set_preset("ultra") && abr.current_index() == 2, "preset not applied keeps the current one");

	abr.destroy();
	abr.destroy();
	check(loop.timer_count() == 0, "destroy stops the monitor");
}

static void test_unknown_initial()
{
	printf("\n=== Unknown initial preset ===\n");
	using namespace quality;

	event::ManualLoop loop;
	Recorder rec;
	AdaptiveBitrateController abr(loop, no_counters, rec.apply(), settings_for("cinema"));
	check(std::string(abr.current_preset().key) == "high", "falls back to high");
}

int main()
{
	printf("=== test_adaptive_bitrate - preset adaptation ===\n");

	test_ladder();
	test_bandwidth_steps();
	test_quality_steps();
	test_manual_presets();
	test_unknown_initial();

	bool passed = failures == 0;
	if (passed) {
		printf("\n*** PASS: adaptive bitrate ***\n");
	} else {
		printf("\n*** FAIL: %d check(s) failed ***\n", failures);
	}
	return passed ? 0 : 1;
}
