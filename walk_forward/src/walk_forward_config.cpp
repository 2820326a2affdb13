#include "walk_forward_config.hpp"
#include "exceptions.hpp"

#include <algorithm>

namespace walk_forward {

    namespace {

        template <typename T>
        T readValue(const json& config, const char* key, T fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            try {
                return config.at(key).get<T>();
            } catch (const json::exception& e) {
                throw core::ConfigException(std::string("Walk-forward config '") + key + "' has the wrong type: " + e.what());
            }
        }

        core::Decimal readDecimal(const json& config, const char* key, const core::Decimal& fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            try {
                return config.at(key).get<core::Decimal>();
            } catch (const std::exception& e) {
                throw core::ConfigException(std::string("Walk-forward config '") + key + "' is not a valid decimal: " + e.what());
            }
        }

        SymbolSuiteConfig symbolFromJson(const json& entry) {
            SymbolSuiteConfig symbol;
            if (entry.is_string()) {
                symbol.symbol = entry.get<std::string>();
                return symbol;
            }
            if (!entry.is_object() || !entry.contains("symbol")) {
                throw core::ConfigException("Suite 'symbols' entries must be a string or an object with 'symbol'.");
            }
            symbol.symbol = readValue<std::string>(entry, "symbol", "");
            symbol.asset_class = readValue<std::string>(entry, "asset_class", symbol.asset_class);
            symbol.timeframe = readValue<std::string>(entry, "timeframe", symbol.timeframe);
            return symbol;
        }

    } // end anonymous namespace

    const std::vector<std::string>& primaryMetricNames() {
        static const std::vector<std::string> names = {"win_rate", "avg_r_multiple", "profit_factor", "sharpe_ratio"};
        return names;
    }

    // --- WalkForwardConfig ---

    WalkForwardConfig WalkForwardConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Walk-forward config must be a JSON object.");
        }
        WalkForwardConfig result;
        result.train_months = readValue<int>(config, "train_months", result.train_months);
        result.validate_months = readValue<int>(config, "validate_months", result.validate_months);
        result.primary_metric = readValue<std::string>(config, "primary_metric", result.primary_metric);
        result.degradation_threshold = readDecimal(config, "degradation_threshold", result.degradation_threshold);
        if (config.contains("backtest")) {
            result.backtest = backtester::BacktestConfig::fromJson(config.at("backtest"));
        }
        result.validate();
        return result;
    }

    json WalkForwardConfig::toJson() const {
        return json{
            {"train_months", train_months},
            {"validate_months", validate_months},
            {"primary_metric", primary_metric},
            {"degradation_threshold", degradation_threshold},
            {"backtest", backtest.toJson()}
        };
    }

    void WalkForwardConfig::validate() const {
        if (train_months <= 0) {
            throw core::ConfigException("train_months must be > 0, got " + std::to_string(train_months));
        }
        if (validate_months <= 0) {
            throw core::ConfigException("validate_months must be > 0, got " + std::to_string(validate_months));
        }
        const auto& names = primaryMetricNames();
        if (std::find(names.begin(), names.end(), primary_metric) == names.end()) {
            throw core::ConfigException("Unknown primary_metric '" + primary_metric + "'");
        }
        if (!degradation_threshold.isPositive()) {
            throw core::ConfigException("degradation_threshold must be > 0, got " + degradation_threshold.toString());
        }
        backtest.validate();
    }

    // --- SuiteConfig ---

    SuiteConfig SuiteConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Suite config must be a JSON object.");
        }
        if (!config.contains("symbols") || !config.at("symbols").is_array()) {
            throw core::ConfigException("Suite config requires a 'symbols' array.");
        }

        SuiteConfig result;
        for (const auto& entry : config.at("symbols")) {
            result.symbols.push_back(symbolFromJson(entry));
        }
        if (config.contains("walk_forward")) {
            result.walk_forward = WalkForwardConfig::fromJson(config.at("walk_forward"));
        }
        result.regression_tolerance_pct = readDecimal(config, "regression_tolerance_pct", result.regression_tolerance_pct);
        result.baselines_dir = readValue<std::string>(config, "baselines_dir", result.baselines_dir);
        result.baseline_version = readValue<std::string>(config, "baseline_version", result.baseline_version);
        result.parallel = readValue<bool>(config, "parallel", result.parallel);
        result.validate();
        return result;
    }

    json SuiteConfig::toJson() const {
        json symbols_json = json::array();
        for (const auto& symbol : symbols) {
            symbols_json.push_back({{"symbol", symbol.symbol}, {"asset_class", symbol.asset_class},
                                    {"timeframe", symbol.timeframe}});
        }
        return json{
            {"symbols", symbols_json},
            {"walk_forward", walk_forward.toJson()},
            {"regression_tolerance_pct", regression_tolerance_pct},
            {"baselines_dir", baselines_dir},
            {"baseline_version", baseline_version},
            {"parallel", parallel}
        };
    }

    void SuiteConfig::validate() const {
        if (symbols.empty()) {
            throw core::ConfigException("Suite config lists no symbols.");
        }
        for (const auto& symbol : symbols) {
            if (symbol.symbol.empty()) {
                throw core::ConfigException("Suite config contains an empty symbol.");
            }
        }
        if (regression_tolerance_pct.isNegative()) {
            throw core::ConfigException("regression_tolerance_pct must be >= 0, got " + regression_tolerance_pct.toString());
        }
        if (baselines_dir.empty()) {
            throw core::ConfigException("baselines_dir must not be empty.");
        }
        walk_forward.validate();
    }

} // namespace walk_forward
