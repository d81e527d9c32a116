#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "backtest/ParamOptimizer.h"
#include "engine/EvaluationCycle.h"
#include "selection/StrategySelector.h"
#include "storage/ResultStoreJsonl.h"
#include "strategy/StrategyFactory.h"
#include "strategy/StrategyRegistry.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratbench;

namespace {

struct CliOptions {
    std::string mode;                   // "evaluate" | "select" | "optimize"
    std::string bars_path;
    std::string config_path = "config/config.json";
    std::string store_path;             // empty: from config
    std::string higher_tf_path;
    std::string live_path;
    std::vector<std::string> strategies;
    bool json_mode = false;
};

void printUsage() {
    std::cerr
        << "Usage:\n"
        << "  stratbench --evaluate <bars.csv|json> [--store <path>] [--strategies a,b] [--config <path>] [--json]\n"
        << "  stratbench --select <bars.csv|json> [--store <path>] [--higher-tf <bars.csv|json>]\n"
        << "             [--live <live.json>] [--strategies a,b] [--config <path>] [--json]\n"
        << "  stratbench --optimize <bars.csv|json> [--strategies a,b] [--config <path>] [--json]\n";
}

std::string trimCopy(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitStrategies(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        token = trimCopy(token);
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    if (argc < 3) {
        return std::nullopt;
    }

    CliOptions opts;
    const std::string command = argv[1];
    if (command == "--evaluate") {
        opts.mode = "evaluate";
    } else if (command == "--select") {
        opts.mode = "select";
    } else if (command == "--optimize") {
        opts.mode = "optimize";
    } else {
        return std::nullopt;
    }
    opts.bars_path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--store" && has_value) {
            opts.store_path = argv[++i];
        } else if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--strategies" && has_value) {
            opts.strategies = splitStrategies(argv[++i]);
        } else if (arg == "--higher-tf" && has_value && opts.mode == "select") {
            opts.higher_tf_path = argv[++i];
        } else if (arg == "--live" && has_value && opts.mode == "select") {
            opts.live_path = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return opts;
}

std::vector<Candle> loadBarsOrThrow(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Price history file not found: " + path);
    }
    auto bars = backtest::DataHistory::load(path);
    if (bars.empty()) {
        throw std::runtime_error("Price history is empty or unreadable: " + path);
    }
    return bars;
}

std::map<std::string, selection::LivePerformance> loadLivePerformance(const std::string& path) {
    std::map<std::string, selection::LivePerformance> out;
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Live performance file not found: " + path);
    }

    nlohmann::json j;
    in >> j;
    for (const auto& item : j.items()) {
        selection::LivePerformance perf;
        perf.total_signals = item.value().value("total_signals", 0);
        perf.win_rate = item.value().value("win_rate", 0.0);
        perf.profit_factor = item.value().value("profit_factor", 0.0);
        perf.avg_rr = item.value().value("avg_rr", 0.0);
        out[item.key()] = perf;
    }
    return out;
}

int runEvaluate(const CliOptions& opts, strategy::StrategyRegistry& registry, storage::IResultStore& store) {
    const auto bars = loadBarsOrThrow(opts.bars_path);

    engine::EvaluationCycle cycle(Config::getInstance().getBacktestConfig(), registry, store);
    const auto summary = cycle.run(bars);

    if (opts.json_mode) {
        nlohmann::json j;
        j["cycle_id"] = summary.cycle_id;
        j["skipped"] = summary.skipped;
        j["strategies_evaluated"] = summary.strategies_evaluated;
        j["strategies_failed"] = summary.strategies_failed;
        j["records_written"] = summary.records_written;
        j["walk_forward_records"] = summary.walk_forward_records;
        j["records"] = nlohmann::json::array();
        for (const auto& record : summary.records) {
            j["records"].push_back(storage::toJson(record));
        }
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Cycle " << summary.cycle_id << (summary.skipped ? " (skipped: history too short)" : "") << "\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& record : summary.records) {
        std::cout << "  " << record.strategy_name
                  << (record.is_walk_forward ? " [walk-forward]" : "")
                  << " " << record.window_days << "d"
                  << " trades=" << record.total_trades
                  << " win_rate=" << record.win_rate
                  << " pf=" << record.profit_factor
                  << " sharpe=" << record.sharpe_ratio
                  << " expectancy=" << record.expectancy;
        if (record.is_overfitted) {
            std::cout << " overfitted=" << (*record.is_overfitted ? "yes" : "no");
        }
        std::cout << "\n";
    }
    std::cout << "---------------------------------------------\n";
    std::cout << "Records written: " << summary.records_written
              << " (walk-forward " << summary.walk_forward_records << ")\n";
    return 0;
}

int runSelect(const CliOptions& opts, const strategy::StrategyRegistry& registry, const storage::IResultStore& store) {
    selection::SelectionInput input;
    input.strategies = registry.names();
    input.records = store.loadAll();
    input.recent_bars = loadBarsOrThrow(opts.bars_path);
    if (!opts.higher_tf_path.empty()) {
        input.higher_timeframe_bars = loadBarsOrThrow(opts.higher_tf_path);
    }
    if (!opts.live_path.empty()) {
        input.live = loadLivePerformance(opts.live_path);
    }

    const selection::StrategySelector selector(Config::getInstance().getSelectorConfig());
    const auto ranked = selector.selectAllRanked(input);

    if (opts.json_mode) {
        nlohmann::json j;
        j["selected"] = ranked.empty() ? nlohmann::json(nullptr) : nlohmann::json(ranked.front().strategy_name);
        j["ranked"] = nlohmann::json::array();
        for (const auto& s : ranked) {
            j["ranked"].push_back({
                {"strategy", s.strategy_name},
                {"composite_score", s.composite_score},
                {"win_rate", s.win_rate},
                {"profit_factor", s.profit_factor},
                {"sharpe_ratio", s.sharpe_ratio},
                {"expectancy", s.expectancy},
                {"max_drawdown", s.max_drawdown},
                {"total_trades", s.total_trades},
                {"window_days", s.window_days},
                {"regime", analytics::regimeToString(s.regime)},
                {"is_degraded", s.is_degraded},
                {"degradation_reason", s.degradation_reason},
                {"live_blended", s.live_blended},
                {"has_confluence", s.has_confluence}
            });
        }
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    if (ranked.empty()) {
        std::cout << "none\n";
        return 0;
    }

    std::cout << ranked.front().strategy_name << "\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& s : ranked) {
        std::cout << "  " << s.strategy_name
                  << " score=" << s.composite_score
                  << " regime=" << analytics::regimeToString(s.regime)
                  << (s.is_degraded ? " DEGRADED: " + s.degradation_reason : std::string())
                  << "\n";
    }
    return 0;
}

int runOptimize(const CliOptions& opts, const strategy::StrategyRegistry& registry) {
    const auto bars = loadBarsOrThrow(opts.bars_path);
    const auto& config = Config::getInstance();
    const backtest::ParamOptimizer optimizer(config.getBacktestConfig());

    nlohmann::json results = nlohmann::json::array();
    for (const auto& name : registry.names()) {
        // Configured overrides are the starting point of the search.
        auto defaults = strategy::StrategyFactory::defaultParams(name);
        for (const auto& kv : config.getStrategyParams(name)) {
            defaults[kv.first] = kv.second;
        }

        const auto result = optimizer.optimize(name, bars, defaults);
        if (!result) {
            if (!opts.json_mode) {
                std::cout << "  " << name << ": no viable parameter set\n";
            }
            continue;
        }

        if (opts.json_mode) {
            results.push_back({
                {"strategy", result->strategy_name},
                {"params", result->best_params},
                {"score", result->score},
                {"total_trades", result->metrics.total_trades},
                {"win_rate", result->metrics.win_rate},
                {"profit_factor", result->metrics.profit_factor},
                {"wfe_ratio", result->wfe_ratio ? nlohmann::json(*result->wfe_ratio) : nlohmann::json(nullptr)},
                {"is_overfitted", result->is_overfitted},
                {"combinations_tested", result->combinations_tested}
            });
            continue;
        }

        std::cout << "  " << name
                  << " score=" << result->score
                  << " trades=" << result->metrics.total_trades
                  << " win_rate=" << result->metrics.win_rate
                  << " pf=" << result->metrics.profit_factor
                  << (result->is_overfitted ? " OVERFITTED" : "")
                  << " tested=" << result->combinations_tested << "\n";
        for (const auto& kv : result->best_params) {
            std::cout << "      " << kv.first << " = " << kv.second << "\n";
        }
    }

    if (opts.json_mode) {
        std::cout << results.dump(2) << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage();
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts->config_path);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        strategy::StrategyRegistry registry;
        registry.registerBuiltins(config.getStrategyParams());
        if (!opts->strategies.empty()) {
            registry.retainOnly(opts->strategies);
        }

        storage::ResultStoreJsonl store(opts->store_path.empty() ? config.getStorePath() : opts->store_path);

        if (opts->mode == "evaluate") {
            return runEvaluate(*opts, registry, store);
        }
        if (opts->mode == "optimize") {
            return runOptimize(*opts, registry);
        }
        return runSelect(*opts, registry, store);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
