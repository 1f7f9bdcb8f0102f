#include "risk_calculator.hpp"
#include <cmath>

namespace SwingScanner {
namespace Core {

std::optional<RiskLevels> calculate_risk_levels(const RiskRequest& request, const Config::RiskConfig& risk_config) {
    if (!std::isfinite(request.entry_reference_price) || !std::isfinite(request.stop_base_price) ||
        !std::isfinite(request.atr_value)) {
        return std::nullopt;
    }

    RiskLevels risk_levels;
    risk_levels.entry = request.entry_reference_price * risk_config.entry_multiplier;
    risk_levels.stop_loss = request.stop_base_price - risk_config.stop_atr_multiplier * request.atr_value;
    risk_levels.risk = risk_levels.entry - risk_levels.stop_loss;

    if (risk_levels.risk <= 0.0 || risk_levels.risk > risk_levels.entry * risk_config.max_risk_pct) {
        return std::nullopt;
    }

    risk_levels.take_profit = risk_levels.entry + risk_config.reward_multiple * risk_levels.risk;
    risk_levels.risk_reward = risk_config.reward_multiple;
    return risk_levels;
}

} // namespace Core
} // namespace SwingScanner
