#ifndef RISK_CALCULATOR_HPP
#define RISK_CALCULATOR_HPP

#include <optional>
#include "configs/strategy_config.hpp"

namespace SwingScanner {
namespace Core {

// Risk request wrapper to avoid multi-parameter functions
struct RiskRequest {
    double entry_reference_price;      // Setup candle high or base pivot
    double stop_base_price;            // Price the stop is placed under
    double atr_value;                  // ATR14 on the setup bar

    RiskRequest(double reference_price, double stop_base, double atr)
        : entry_reference_price(reference_price), stop_base_price(stop_base), atr_value(atr) {}
};

struct RiskLevels {
    double entry;
    double stop_loss;
    double take_profit;
    double risk;
    double risk_reward;

    RiskLevels() : entry(0.0), stop_loss(0.0), take_profit(0.0), risk(0.0), risk_reward(0.0) {}
};

/**
 * Shared entry / stop / target formula of every pattern engine.
 * Returns nothing when the risk is not positive or exceeds the configured share of entry.
 */
std::optional<RiskLevels> calculate_risk_levels(const RiskRequest& request, const Config::RiskConfig& risk_config);

} // namespace Core
} // namespace SwingScanner

#endif // RISK_CALCULATOR_HPP
