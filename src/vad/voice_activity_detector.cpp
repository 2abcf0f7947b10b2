/**
 * @file voice_activity_detector.cpp
 * @brief Percentile noise-floor VAD implementation
 */

#include "vad/voice_activity_detector.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <deque>
#include <sstream>
#include <vector>

namespace luna_voice {
namespace vad {

class VoiceActivityDetector::Impl {
public:
    explicit Impl(const VADConfig& config)
        : config_(config)
        , silence_timeout_(Duration(config.silence_timeout_ms))
        , in_speech_(false)
        , in_silence_gap_(false)
        , has_noise_sample_(false)
    {
        if (config_.noise_window_size == 0) config_.noise_window_size = 1;
        config_.noise_percentile = std::clamp(config_.noise_percentile, 0.0f, 1.0f);

        std::ostringstream oss;
        oss << "Detector initialized: threshold=" << config_.threshold_db << "dB"
            << ", silence_timeout=" << config_.silence_timeout_ms << "ms"
            << ", window=" << config_.noise_window_size
            << "x" << config_.noise_sample_interval_ms << "ms"
            << ", percentile=" << config_.noise_percentile;
        LOG_VAD(oss.str());
    }

    Event process(const AudioFrame& frame) {
        TimePoint at = frame.captured_at();
        float level = frame.level_db();

        sample_noise(level, at);

        Decision decision;
        decision.level = level;
        decision.noise_floor = noise_floor();
        decision.is_speech = (level - decision.noise_floor) > config_.threshold_db;
        last_decision_ = decision;

        if (decision.is_speech) {
            last_speech_at_ = at;
            in_silence_gap_ = false;
            if (!in_speech_) {
                in_speech_ = true;
                speech_started_at_ = at;
                log_edge("SpeechStart", decision);
                return Event::SpeechStart;
            }
            return Event::None;
        }

        if (!in_speech_) {
            return Event::None;
        }

        if (!in_silence_gap_) {
            in_silence_gap_ = true;
            silence_started_at_ = at;
        }
        return check_silence(at);
    }

    Event tick(TimePoint now) {
        if (!in_speech_ || !in_silence_gap_) {
            return Event::None;
        }
        return check_silence(now);
    }

    void reset() {
        in_speech_ = false;
        in_silence_gap_ = false;
        last_decision_ = Decision{};
        // Noise window survives: the room did not change
    }

    Decision last_decision() const {
        return last_decision_;
    }

    Stats get_stats() const {
        Stats stats;
        stats.in_speech = in_speech_;
        stats.noise_floor = noise_floor();
        stats.threshold_db = config_.threshold_db;
        stats.silence_timeout_ms = silence_timeout_.count();
        stats.noise_samples = window_.size();
        stats.speech_started_at = speech_started_at_;
        stats.last_speech_at = last_speech_at_;
        return stats;
    }

    bool is_speech() const {
        return in_speech_;
    }

    void set_threshold_db(float threshold_db) {
        config_.threshold_db = threshold_db;
        LOG_VAD("threshold set to " + std::to_string(threshold_db) + "dB");
    }

    void set_silence_timeout(Duration timeout) {
        silence_timeout_ = timeout;
        LOG_VAD("silence timeout set to " + std::to_string(timeout.count()) + "ms");
    }

    float noise_floor() const {
        if (window_.empty()) {
            return SILENCE_LEVEL_DB;
        }
        std::vector<float> sorted(window_.begin(), window_.end());
        std::sort(sorted.begin(), sorted.end());
        size_t index = static_cast<size_t>(
            std::floor(config_.noise_percentile * static_cast<float>(sorted.size() - 1)));
        return sorted[std::min(index, sorted.size() - 1)];
    }

private:
    void sample_noise(float level, TimePoint at) {
        if (has_noise_sample_ &&
            ms_between(last_noise_sample_at_, at) < config_.noise_sample_interval_ms) {
            return;
        }
        window_.push_back(level);
        while (window_.size() > config_.noise_window_size) {
            window_.pop_front();
        }
        last_noise_sample_at_ = at;
        has_noise_sample_ = true;
    }

    Event check_silence(TimePoint now) {
        if (now - silence_started_at_ < silence_timeout_) {
            return Event::None;
        }
        in_speech_ = false;
        in_silence_gap_ = false;
        log_edge("SpeechEnd", last_decision_);
        return Event::SpeechEnd;
    }

    void log_edge(const char* edge, const Decision& decision) const {
        std::ostringstream oss;
        oss << edge << " level=" << decision.level
            << " floor=" << decision.noise_floor
            << " threshold=" << config_.threshold_db;
        LOG_VAD(oss.str());
    }

    VADConfig config_;
    Duration silence_timeout_;

    std::deque<float> window_;
    TimePoint last_noise_sample_at_{};

    bool in_speech_;
    bool in_silence_gap_;
    bool has_noise_sample_;
    TimePoint speech_started_at_{};
    TimePoint last_speech_at_{};
    TimePoint silence_started_at_{};
    Decision last_decision_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

VoiceActivityDetector::VoiceActivityDetector(const VADConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

VoiceActivityDetector::~VoiceActivityDetector() = default;

Event VoiceActivityDetector::process(const AudioFrame& frame) {
    return impl_->process(frame);
}

Event VoiceActivityDetector::tick(TimePoint now) {
    return impl_->tick(now);
}

void VoiceActivityDetector::reset() {
    impl_->reset();
}

Decision VoiceActivityDetector::last_decision() const {
    return impl_->last_decision();
}

Stats VoiceActivityDetector::get_stats() const {
    return impl_->get_stats();
}

bool VoiceActivityDetector::is_speech() const {
    return impl_->is_speech();
}

void VoiceActivityDetector::set_threshold_db(float threshold_db) {
    impl_->set_threshold_db(threshold_db);
}

void VoiceActivityDetector::set_silence_timeout(Duration timeout) {
    impl_->set_silence_timeout(timeout);
}

float VoiceActivityDetector::noise_floor() const {
    return impl_->noise_floor();
}

} // namespace vad
} // namespace luna_voice
