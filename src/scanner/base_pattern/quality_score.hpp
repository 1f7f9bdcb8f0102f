#ifndef QUALITY_SCORE_HPP
#define QUALITY_SCORE_HPP

#include "configs/strategy_config.hpp"

namespace SwingScanner {
namespace Core {

// Quality score request wrapper to avoid multi-parameter functions
struct QualityScoreRequest {
    double depth_pct;                  // Base depth as a fraction of the base high
    double max_depth_pct;              // Depth where tightness credit reaches zero
    double volume_dry_ratio;           // Recent volume / 50-day average
    double rs_vs_benchmark;            // Stock 63-day return minus benchmark 63-day return
    bool rs_blue_dot;

    QualityScoreRequest()
        : depth_pct(0.0), max_depth_pct(0.0), volume_dry_ratio(1.0), rs_vs_benchmark(0.0), rs_blue_dot(false) {}
};

/**
 * Four 25-point factors, each interpolated linearly between full and zero credit:
 * relative strength, tightness, volume dry-up and the RS blue dot.
 * Always returns an integer in [0, 100]; non-finite inputs earn no credit for their factor.
 */
int calculate_quality_score(const QualityScoreRequest& request, const Config::BasePatternConfig& base_config);

} // namespace Core
} // namespace SwingScanner

#endif // QUALITY_SCORE_HPP
