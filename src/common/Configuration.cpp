#include "Configuration.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

Configuration::Configuration() {
    const RulesConstants defaults;
    log_level_ = level_env(ROW_LOG_LEVEL_ENV, spdlog::level::info);
    constants_.defense_base = int_env(ROW_DEFENSE_BASE_ENV, defaults.defense_base);
    constants_.passive_base = int_env(ROW_PASSIVE_BASE_ENV, defaults.passive_base);
    constants_.point_buy_budget = int_env(ROW_POINT_BUY_BUDGET_ENV, defaults.point_buy_budget);
    constants_.level_hp_average = int_env(ROW_LEVEL_HP_AVERAGE_ENV, defaults.level_hp_average);
}

spdlog::level::level_enum Configuration::log_level() const { return log_level_; }
int Configuration::defense_base() const { return constants_.defense_base; }
int Configuration::passive_base() const { return constants_.passive_base; }
int Configuration::point_buy_budget() const { return constants_.point_buy_budget; }
int Configuration::level_hp_average() const { return constants_.level_hp_average; }
RulesConstants Configuration::rules_constants() const { return constants_; }

int Configuration::int_env(const std::string &envkey, const int default_value) const {
    const auto *value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    const std::string_view text(value);
    int result{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size())
        throw std::invalid_argument(
            fmt::format("The environment variable {} must be an integer, not '{}'", envkey, text));
    return result;
}

spdlog::level::level_enum Configuration::level_env(const std::string &envkey,
                                                   spdlog::level::level_enum default_value) const {
    const auto *value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    const auto level = spdlog::level::from_str(value);
    // from_str answers "off" for anything it doesn't recognise.
    if (level == spdlog::level::off && std::string_view(value) != "off")
        throw std::invalid_argument(
            fmt::format("The environment variable {} names an unknown log level '{}'", envkey, value));
    return level;
}

Configuration &Configuration::singleton() {
    static Configuration singleton;
    return singleton;
}
