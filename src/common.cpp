#include "common.h"
#include <cmath>

namespace luna_voice {

float AudioFrame::compute_level_db(const AudioBuffer& samples) {
    if (samples.empty()) return SILENCE_LEVEL_DB;

    double sum_sq = 0.0;
    for (Sample s : samples) {
        double normalized = static_cast<double>(s) / 32768.0;
        sum_sq += normalized * normalized;
    }
    double rms = std::sqrt(sum_sq / static_cast<double>(samples.size()));
    if (rms <= 1e-5) return SILENCE_LEVEL_DB;

    float db = static_cast<float>(20.0 * std::log10(rms));
    return db < SILENCE_LEVEL_DB ? SILENCE_LEVEL_DB : db;
}

} // namespace luna_voice
