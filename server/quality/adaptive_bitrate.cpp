/*
 * Adaptive Bitrate Controller Implementation
 */

#include "adaptive_bitrate.h"
#include <cstdio>
#include <exception>

namespace quality {

AdaptiveBitrateController::AdaptiveBitrateController(event::Loop& loop,
                                                     ConnectionMonitor::CounterSource counters,
                                                     ApplyFunction apply,
                                                     BitrateSettings settings,
                                                     MonitorSettings monitor_settings)
    : loop_(loop)
    , apply_(std::move(apply))
    , settings_(std::move(settings))
    , monitor_(new ConnectionMonitor(loop, std::move(counters), std::move(monitor_settings)))
    , auto_adjust_(settings_.auto_adjust)
{
    auto index = preset_index(settings_.initial_preset);
    if (index) {
        current_index_ = *index;
    } else {
        fprintf(stderr, "[Bitrate] Unknown initial preset '%s', using '%s'\n",
                settings_.initial_preset.c_str(), preset_ladder()[current_index_].key);
    }

    monitor_->on_stats([this](const NetworkStats& stats) {
        if (auto_adjust_) {
            adapt_to_bandwidth(stats);
        }
    });

    monitor_->on_quality_change([this](const QualityMetrics& metrics) {
        if (auto_adjust_) {
            adapt_to_quality(metrics);
        }
    });
}

AdaptiveBitrateController::~AdaptiveBitrateController() {
    destroy();
}

void AdaptiveBitrateController::start() {
    const QualityPreset& preset = current_preset();
    if (apply_) {
        try {
            if (!apply_(preset.limits)) {
                fprintf(stderr, "[Bitrate] %s: initial preset %s not applied\n",
                        settings_.label.c_str(), preset.name);
            }
        } catch (const std::exception& e) {
            fprintf(stderr, "[Bitrate] %s: failed to apply initial preset: %s\n",
                    settings_.label.c_str(), e.what());
        }
    }
    monitor_->start();
}

void AdaptiveBitrateController::stop() {
    if (monitor_) {
        monitor_->stop();
    }
}

void AdaptiveBitrateController::destroy() {
    if (monitor_) {
        monitor_->destroy();
    }
}

bool AdaptiveBitrateController::set_preset(const std::string& key) {
    auto index = preset_index(key);
    if (!index) {
        fprintf(stderr, "[Bitrate] %s: unknown preset '%s'\n", settings_.label.c_str(), key.c_str());
        return false;
    }
    return apply_preset(*index, "manual");
}

bool AdaptiveBitrateController::force_preset(const std::string& key) {
    auto index = preset_index(key);
    if (!index) {
        fprintf(stderr, "[Bitrate] %s: unknown preset '%s'\n", settings_.label.c_str(), key.c_str());
        return false;
    }
    auto_adjust_ = false;
    return apply_preset(*index, "forced");
}

void AdaptiveBitrateController::set_auto_adjust(bool enabled) {
    auto_adjust_ = enabled;
    fprintf(stderr, "[Bitrate] %s: auto adjust %s\n", settings_.label.c_str(), enabled ? "on" : "off");
}

const QualityPreset& AdaptiveBitrateController::current_preset() const {
    return preset_ladder()[current_index_];
}

bool AdaptiveBitrateController::in_cooldown() const {
    if (!last_adjustment_) {
        return false;
    }
    return loop_.now() - *last_adjustment_ < settings_.cooldown;
}

bool AdaptiveBitrateController::can_increase() const {
    // No recent adaptation landed above the current level
    for (size_t index : adaptation_history_) {
        if (index < current_index_) {
            return false;
        }
    }
    return true;
}

void AdaptiveBitrateController::adapt_to_quality(const QualityMetrics& metrics) {
    if (in_cooldown()) {
        return;
    }

    const size_t lowest = PRESET_COUNT - 1;
    size_t target = current_index_;

    switch (metrics.category) {
        case QualityCategory::Poor:
            if (current_index_ < lowest) {
                target = current_index_ + 1;
            }
            break;

        case QualityCategory::Fair:
            if ((has_issue(metrics, ISSUE_HIGH_LOSS) || has_issue(metrics, ISSUE_HIGH_LATENCY)) &&
                current_index_ < lowest) {
                target = current_index_ + 1;
            }
            break;

        case QualityCategory::Good:
        case QualityCategory::Excellent:
            if (current_index_ > 0 && can_increase()) {
                target = current_index_ - 1;
            }
            break;
    }

    if (target != current_index_) {
        apply_preset(target, category_name(metrics.category));
    }
}

void AdaptiveBitrateController::adapt_to_bandwidth(const NetworkStats& stats) {
    if (stats.bandwidth_bps <= 0.0) {
        return;
    }

    size_t wanted = preset_index_for_bandwidth(stats.bandwidth_bps);
    if (wanted == current_index_ || in_cooldown()) {
        return;
    }

    // Only neighbouring presets; a hint further away is ignored
    size_t distance = wanted > current_index_ ? wanted - current_index_ : current_index_ - wanted;
    if (distance > 1) {
        fprintf(stderr, "[Bitrate] %s: %.0f kbps suggests %s, %zu steps from %s, ignored\n",
                settings_.label.c_str(), stats.bandwidth_bps / 1000.0, preset_ladder()[wanted].key,
                distance, current_preset().key);
        return;
    }
    apply_preset(wanted, "bandwidth");
}

bool AdaptiveBitrateController::apply_preset(size_t index, const char* reason) {
    const QualityPreset& from = current_preset();
    const QualityPreset& to = preset_ladder()[index];

    if (apply_) {
        bool applied = false;
        try {
            applied = apply_(to.limits);
        } catch (const std::exception& e) {
            fprintf(stderr, "[Bitrate] %s: failed to apply preset %s: %s\n",
                    settings_.label.c_str(), to.name, e.what());
            return false;
        }
        if (!applied) {
            fprintf(stderr, "[Bitrate] %s: failed to apply preset %s\n",
                    settings_.label.c_str(), to.name);
            return false;
        }
    }

    current_index_ = index;
    last_adjustment_ = loop_.now();
    adaptation_history_.push_back(index);
    while (adaptation_history_.size() > settings_.adaptation_history_size) {
        adaptation_history_.pop_front();
    }

    fprintf(stderr, "[Bitrate] %s: %s -> %s (%s)\n",
            settings_.label.c_str(), from.name, to.name, reason);

    if (preset_callback_) {
        preset_callback_(to, reason);
    }
    return true;
}

} // namespace quality
