/*
 * Adaptive Bitrate Controller
 *
 * Owns the quality monitor of one link and moves that link's outgoing
 * encoders up and down the preset ladder:
 * - quality category changes: poor (or fair with high loss/latency) steps
 *   down, good/excellent steps up unless a recent adaptation came from a
 *   higher preset
 * - every stats tick: measured bandwidth pulls the preset one step toward
 *   the level that bandwidth supports
 *
 * Automatic moves are at most one ladder step and at least one cooldown
 * apart. Explicit set_preset/force_preset are not gated.
 */

#ifndef ADAPTIVE_BITRATE_H
#define ADAPTIVE_BITRATE_H

#include "connection_monitor.h"
#include "quality_preset.h"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace quality {

struct BitrateSettings {
    std::string initial_preset = "high";
    bool auto_adjust = true;
    std::chrono::milliseconds cooldown{5000};
    size_t adaptation_history_size = 3;
    std::string label;
};

class AdaptiveBitrateController {
public:
    // Push limits to the link's encoders. Returns false when they were not applied.
    using ApplyFunction = std::function<bool(const EncodingLimits&)>;
    using PresetChangeCallback = std::function<void(const QualityPreset& preset, const char* reason)>;

    AdaptiveBitrateController(event::Loop& loop,
                              ConnectionMonitor::CounterSource counters,
                              ApplyFunction apply,
                              BitrateSettings settings = BitrateSettings(),
                              MonitorSettings monitor_settings = MonitorSettings());
    ~AdaptiveBitrateController();

    AdaptiveBitrateController(const AdaptiveBitrateController&) = delete;
    AdaptiveBitrateController& operator=(const AdaptiveBitrateController&) = delete;

    // Apply the current preset's limits and start sampling
    void start();
    void stop();

    // Stop the monitor and drop its listeners. Safe to call more than once.
    void destroy();

    // Switch preset, leaving auto mode as it is
    bool set_preset(const std::string& key);

    // Switch preset and turn auto mode off
    bool force_preset(const std::string& key);

    void set_auto_adjust(bool enabled);
    bool auto_adjust() const { return auto_adjust_; }

    const QualityPreset& current_preset() const;
    size_t current_index() const { return current_index_; }

    ConnectionMonitor& monitor() { return *monitor_; }
    const ConnectionMonitor& monitor() const { return *monitor_; }

    void on_preset_change(PresetChangeCallback callback) { preset_callback_ = std::move(callback); }

private:
    void adapt_to_quality(const QualityMetrics& metrics);
    void adapt_to_bandwidth(const NetworkStats& stats);
    bool in_cooldown() const;
    bool can_increase() const;
    bool apply_preset(size_t index, const char* reason);

    event::Loop& loop_;
    ApplyFunction apply_;
    BitrateSettings settings_;
    std::unique_ptr<ConnectionMonitor> monitor_;

    size_t current_index_ = 1;
    bool auto_adjust_ = true;
    std::optional<event::Clock::time_point> last_adjustment_;
    std::deque<size_t> adaptation_history_;
    PresetChangeCallback preset_callback_;
};

} // namespace quality

#endif // ADAPTIVE_BITRATE_H
