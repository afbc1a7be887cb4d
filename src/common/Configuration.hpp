#pragma once

#include "RulesConstants.hpp"

#include <spdlog/common.h>

#include <string>

/**
 * Environment variables read by Configuration. All are optional.
 */
static inline constexpr auto ROW_LOG_LEVEL_ENV = "ROW_LOG_LEVEL";
static inline constexpr auto ROW_DEFENSE_BASE_ENV = "ROW_DEFENSE_BASE";
static inline constexpr auto ROW_PASSIVE_BASE_ENV = "ROW_PASSIVE_BASE";
static inline constexpr auto ROW_POINT_BUY_BUDGET_ENV = "ROW_POINT_BUY_BUDGET";
static inline constexpr auto ROW_LEVEL_HP_AVERAGE_ENV = "ROW_LEVEL_HP_AVERAGE";

/**
 * Accessors for configuration settings. Client code should use
 * the static singleton.
 */
class Configuration {
public:
    Configuration();
    [[nodiscard]] spdlog::level::level_enum log_level() const;
    [[nodiscard]] int defense_base() const;
    [[nodiscard]] int passive_base() const;
    [[nodiscard]] int point_buy_budget() const;
    [[nodiscard]] int level_hp_average() const;
    // The settings that feed the rules, bundled for the builder, validator and advancement engine.
    [[nodiscard]] RulesConstants rules_constants() const;

    static Configuration &singleton();

private:
    [[nodiscard]] int int_env(const std::string &envkey, const int default_value) const;
    [[nodiscard]] spdlog::level::level_enum level_env(const std::string &envkey,
                                                      spdlog::level::level_enum default_value) const;
    spdlog::level::level_enum log_level_;
    RulesConstants constants_;
};
