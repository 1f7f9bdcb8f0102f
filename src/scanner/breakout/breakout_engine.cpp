#include "breakout_engine.hpp"
#include <stdexcept>

namespace SwingScanner {
namespace Core {

SetupOutcome evaluate_breakout_rules(const BreakoutInputs& inputs, const Config::StrategyConfig& strategy_config) {
    for (const BreakoutPathRule& path_rule : get_breakout_path_rules()) {
        std::optional<BreakoutPathMatch> path_match = path_rule.predicate(inputs, strategy_config.breakout);
        if (path_match) {
            return path_rule.builder(inputs, *path_match, strategy_config);
        }
    }
    return SetupOutcome::no_signal("No breakout path matched");
}

SetupOutcome scan_breakout(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    try {
        EngineOutcome<BreakoutInputs> prepared_inputs = prepare_breakout_inputs(request, strategy_config);
        if (!prepared_inputs.has_value()) {
            return SetupOutcome::rejected(prepared_inputs.reason, prepared_inputs.detail);
        }
        return evaluate_breakout_rules(*prepared_inputs.value, strategy_config);
    } catch (const std::exception& exception_error) {
        return SetupOutcome::computation_error(exception_error.what());
    }
}

} // namespace Core
} // namespace SwingScanner
