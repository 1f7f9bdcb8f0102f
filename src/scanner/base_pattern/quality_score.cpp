#include "quality_score.hpp"
#include <algorithm>
#include <cmath>

namespace SwingScanner {
namespace Core {

namespace {
    constexpr double FACTOR_POINTS = 25.0;
}

int calculate_quality_score(const QualityScoreRequest& request, const Config::BasePatternConfig& base_config) {
    double rs_points = 0.0;
    if (std::isfinite(request.rs_vs_benchmark) && base_config.score_rs_full_credit > 0.0) {
        rs_points = std::min(FACTOR_POINTS, std::max(0.0, request.rs_vs_benchmark / base_config.score_rs_full_credit * FACTOR_POINTS));
    }

    double tightness_points = 0.0;
    if (std::isfinite(request.depth_pct)) {
        if (request.depth_pct <= base_config.score_tight_depth_pct) {
            tightness_points = FACTOR_POINTS;
        } else if (request.depth_pct < request.max_depth_pct) {
            double depth_ratio = (request.depth_pct - base_config.score_tight_depth_pct) /
                                 (request.max_depth_pct - base_config.score_tight_depth_pct);
            tightness_points = (1.0 - depth_ratio) * FACTOR_POINTS;
        }
    }

    double volume_points = 0.0;
    if (std::isfinite(request.volume_dry_ratio)) {
        if (request.volume_dry_ratio <= base_config.score_volume_full_credit) {
            volume_points = FACTOR_POINTS;
        } else if (request.volume_dry_ratio < 1.0) {
            volume_points = (1.0 - request.volume_dry_ratio) / (1.0 - base_config.score_volume_full_credit) * FACTOR_POINTS;
        }
    }

    double blue_dot_points = request.rs_blue_dot ? FACTOR_POINTS : 0.0;

    int total_score = static_cast<int>(std::lround(rs_points + tightness_points + volume_points + blue_dot_points));
    return std::min(100, std::max(0, total_score));
}

} // namespace Core
} // namespace SwingScanner
