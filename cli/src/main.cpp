// cli/src/main.cpp

#include <chrono>
#include <iostream>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <exception>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "backtester.hpp"
#include "backtest_config.hpp"
#include "interfaces.hpp"
#include "position_sizer.hpp"
#include "scheduled_signal_source.hpp"
#include "walk_forward_config.hpp"
#include "walk_forward_suite.hpp"

using json = nlohmann::json;

namespace {

    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitUsage = 2;
    constexpr int kExitRegression = 3;

    const char* const kUsage =
        "Usage:\n"
        "  wyckoff_backtest backtest --db <path> --symbol <s> --timeframe <tf> --from <date> --to <date>\n"
        "                            --signals <json> [--config <json>] [--out <json>]\n"
        "  wyckoff_backtest walk-forward --db <path> --suite <json> --signals <json>\n"
        "                            [--save-baselines] [--out <json>]\n";

    class UsageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Arguments {
        std::string command;
        std::map<std::string, std::string> options;
        bool save_baselines = false;

        const std::string& require(const std::string& name) const {
            auto it = options.find(name);
            if (it == options.end() || it->second.empty()) {
                throw UsageError("missing required option --" + name);
            }
            return it->second;
        }

        std::string get(const std::string& name) const {
            auto it = options.find(name);
            return it == options.end() ? std::string() : it->second;
        }
    };

    Arguments parseArguments(int argc, char* argv[]) {
        if (argc < 2) {
            throw UsageError("no command given");
        }
        Arguments args;
        args.command = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string token = argv[i];
            if (token.rfind("--", 0) != 0) {
                throw UsageError("unexpected argument '" + token + "'");
            }
            std::string name = token.substr(2);
            if (name == "save-baselines") {
                args.save_baselines = true;
                continue;
            }
            if (i + 1 >= argc) {
                throw UsageError("option --" + name + " needs a value");
            }
            args.options[name] = argv[++i];
        }
        return args;
    }

    json readJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException("Failed to open JSON file: " + path);
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException("Failed to parse JSON file '" + path + "': " + e.what());
        }
    }

    void writeJsonFile(const std::string& path, const json& document) {
        std::ofstream ofs(path, std::ios::trunc);
        if (!ofs.is_open()) {
            throw core::DataLoadException("Failed to open output file: " + path);
        }
        ofs << document.dump(2) << '\n';
        if (!ofs) {
            throw core::DataLoadException("Failed writing output file: " + path);
        }
        core::logging::getLogger()->info("Result written to {}", path);
    }

    // A date without a time covers the whole day
    core::Timestamp parseRangeEnd(const std::string& text) {
        core::Timestamp ts = core::utils::stringToTimestamp(text);
        if (text.size() == 10) {
            ts = core::utils::addDays(ts, 1) - std::chrono::seconds(1);
        }
        return ts;
    }

    void connectDatabase(data::DatabaseManager& db_manager, const std::string& db_path) {
        if (!db_manager.connect()) {
            throw core::DataLoadException("Cannot open bar database: " + db_path);
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Cannot initialize bar database schema: " + db_path);
        }
    }

    class LogProgressNotifier : public backtester::IProgressNotifier {
    public:
        void onProgress(const backtester::ProgressUpdate& update) override {
            core::logging::getLogger()->info("Progress: {}/{} bars ({:.1f}%)", update.bars_processed,
                                             update.total_bars, update.percent_complete);
        }
    };

    int runBacktest(const Arguments& args) {
        auto logger = core::logging::getLogger();

        const std::string& db_path = args.require("db");
        const std::string& symbol = args.require("symbol");
        const std::string& timeframe = args.require("timeframe");
        const core::Timestamp from = core::utils::stringToTimestamp(args.require("from"));
        const core::Timestamp to = parseRangeEnd(args.require("to"));
        const std::string& signals_path = args.require("signals");

        backtester::BacktestConfig config;
        if (!args.get("config").empty()) {
            config = backtester::BacktestConfig::fromJson(readJsonFile(args.get("config")));
        }
        backtester::ScheduledSignalSource signals = backtester::ScheduledSignalSource::fromJson(readJsonFile(signals_path));
        logger->info("Loaded {} scheduled signals from {}", signals.size(), signals_path);

        data::DatabaseManager db_manager(db_path);
        connectDatabase(db_manager, db_path);
        core::TimeSeries<core::Bar> bars = db_manager.queryBars(symbol, timeframe, from, to);
        db_manager.disconnect();
        logger->info("Loaded {} bars for {} ({}) from {} to {}", bars.size(), symbol, timeframe,
                     core::utils::timestampToString(from), core::utils::timestampToString(to));

        backtester::FixedRiskPositionSizer sizer;
        LogProgressNotifier progress;
        backtester::Backtester the_backtester(config, signals, sizer, &progress);
        backtester::BacktestResult result = the_backtester.run(bars);

        result.metrics.logMetrics();
        if (result.cost_summary) {
            result.cost_summary->logSummary();
        }
        if (!args.get("out").empty()) {
            writeJsonFile(args.get("out"), result.toJson());
        }
        return kExitOk;
    }

    int runWalkForward(const Arguments& args) {
        auto logger = core::logging::getLogger();

        const std::string& db_path = args.require("db");
        walk_forward::SuiteConfig suite_config = walk_forward::SuiteConfig::fromJson(readJsonFile(args.require("suite")));
        const backtester::ScheduledSignalSource signals =
            backtester::ScheduledSignalSource::fromJson(readJsonFile(args.require("signals")));

        data::DatabaseManager db_manager(db_path);
        connectDatabase(db_manager, db_path);
        const core::Timestamp from = core::utils::stringToTimestamp("1970-01-01");
        const core::Timestamp to = core::utils::stringToTimestamp("2100-01-01");

        walk_forward::BarLoader loader = [&db_manager, from, to](const walk_forward::SymbolSuiteConfig& symbol) {
            return db_manager.queryBars(symbol.symbol, symbol.timeframe, from, to);
        };
        walk_forward::SignalSourceFactory factory = [&signals](const std::string&) -> std::unique_ptr<backtester::ISignalSource> {
            return std::make_unique<backtester::ScheduledSignalSource>(signals);
        };

        backtester::FixedRiskPositionSizer sizer;
        walk_forward::WalkForwardSuite suite(suite_config, loader, factory, sizer);
        walk_forward::SuiteResult result = suite.run();

        for (const auto& symbol_result : result.symbol_results) {
            if (symbol_result.error) {
                logger->error("{}: {}", symbol_result.symbol, *symbol_result.error);
            } else {
                logger->info("{}: {} windows, avg validate win rate {}, profit factor {}, sharpe {}, max drawdown {}",
                             symbol_result.symbol, symbol_result.window_count,
                             symbol_result.avg_validate_win_rate.toString(4),
                             symbol_result.avg_validate_profit_factor.toString(4),
                             symbol_result.avg_validate_sharpe.toString(4),
                             symbol_result.avg_validate_max_drawdown.toString(4));
            }
        }

        if (args.save_baselines) {
            auto saved = suite.saveBaselines(result);
            logger->info("Saved {} baselines to {}", saved.size(), suite_config.baselines_dir);
        }
        if (!args.get("out").empty()) {
            writeJsonFile(args.get("out"), result.toJson());
        }

        if (!result.overall_pass) {
            for (const auto& detail : result.regression_details) {
                logger->error("Regression: {}", detail);
            }
            return kExitRegression;
        }
        return kExitOk;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        core::logging::initialize("wyckoff_backtest", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();

        Arguments args = parseArguments(argc, argv);
        logger->info("wyckoff_backtest {} starting", args.command);

        if (args.command == "backtest") {
            return runBacktest(args);
        }
        if (args.command == "walk-forward") {
            return runWalkForward(args);
        }
        if (args.command == "--help" || args.command == "help") {
            std::cout << kUsage;
            return kExitOk;
        }
        throw UsageError("unknown command '" + args.command + "'");

    // --- Exception Handling ---
    } catch (const UsageError& ex) {
        std::cerr << "Usage error: " << ex.what() << "\n" << kUsage;
        return kExitUsage;
    } catch (const core::BacktestEngineException& ex) {
        std::cerr << "Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Engine Error: {}", ex.what());
        return kExitError;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return kExitError;
    } catch (...) {
        std::cerr << "Unknown Error occurred." << std::endl;
        if (logger) logger->critical("Unknown Error occurred.");
        return kExitError;
    }
}
