#include <gtest/gtest.h>
#include "scanner/risk/risk_calculator.hpp"
#include "scanner/data_structures/data_structures.hpp"

using namespace SwingScanner::Core;
using SwingScanner::Config::RiskConfig;

TEST(RiskCalculatorTest, EntryStopAndTargetFromSharedFormula) {
    RiskConfig risk_config;
    std::optional<RiskLevels> risk_levels = calculate_risk_levels(RiskRequest(100.0, 95.0, 2.0), risk_config);

    ASSERT_TRUE(risk_levels.has_value());
    EXPECT_NEAR(risk_levels->entry, 100.1, 1e-9);
    EXPECT_NEAR(risk_levels->stop_loss, 94.6, 1e-9);
    EXPECT_NEAR(risk_levels->risk, 5.5, 1e-9);
    EXPECT_NEAR(risk_levels->take_profit, 111.1, 1e-9);
    EXPECT_NEAR(risk_levels->risk_reward, 2.0, 1e-9);
}

TEST(RiskCalculatorTest, RejectsRiskWiderThanLimit) {
    EXPECT_FALSE(calculate_risk_levels(RiskRequest(100.0, 80.0, 10.0), RiskConfig()).has_value());
}

TEST(RiskCalculatorTest, RejectsStopAboveEntry) {
    EXPECT_FALSE(calculate_risk_levels(RiskRequest(100.0, 101.0, 0.5), RiskConfig()).has_value());
}

TEST(RiskCalculatorTest, RejectsUndefinedInputs) {
    EXPECT_FALSE(calculate_risk_levels(RiskRequest(100.0, 95.0, UNDEFINED_VALUE), RiskConfig()).has_value());
    EXPECT_FALSE(calculate_risk_levels(RiskRequest(UNDEFINED_VALUE, 95.0, 1.0), RiskConfig()).has_value());
}

TEST(RiskCalculatorTest, AcceptedLevelsKeepStopBelowEntryBelowTarget) {
    RiskConfig risk_config;
    for (double stop_base = 80.0; stop_base < 100.0; stop_base += 0.5) {
        for (double atr_value = 0.0; atr_value <= 4.0; atr_value += 0.5) {
            std::optional<RiskLevels> risk_levels = calculate_risk_levels(RiskRequest(100.0, stop_base, atr_value), risk_config);
            if (!risk_levels) {
                continue;
            }
            EXPECT_LT(risk_levels->stop_loss, risk_levels->entry);
            EXPECT_LT(risk_levels->entry, risk_levels->take_profit);
            EXPECT_NEAR(risk_levels->take_profit - risk_levels->entry, 2.0 * (risk_levels->entry - risk_levels->stop_loss), 1e-9);
            EXPECT_LE(risk_levels->risk, 0.15 * risk_levels->entry);
        }
    }
}

TEST(RiskCalculatorTest, MultipliersComeFromConfiguration) {
    RiskConfig risk_config;
    risk_config.reward_multiple = 3.0;
    risk_config.stop_atr_multiplier = 0.0;

    std::optional<RiskLevels> risk_levels = calculate_risk_levels(RiskRequest(50.0, 48.0, 1.0), risk_config);
    ASSERT_TRUE(risk_levels.has_value());
    EXPECT_NEAR(risk_levels->stop_loss, 48.0, 1e-9);
    EXPECT_NEAR(risk_levels->take_profit, 50.05 + 3.0 * 2.05, 1e-9);
    EXPECT_NEAR(risk_levels->risk_reward, 3.0, 1e-9);
}
