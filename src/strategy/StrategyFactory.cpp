#include "strategy/StrategyFactory.h"
#include "strategy/BreakoutExpansionStrategy.h"
#include "strategy/EmaMomentumStrategy.h"
#include "strategy/LiquiditySweepStrategy.h"
#include "strategy/TrendContinuationStrategy.h"
#include "common/Logger.h"

#include <algorithm>
#include <memory>

namespace stratbench {
namespace strategy {

namespace {

void warnUnknownKeys(const std::string& name, const ParamMap& params, const ParamMap& known) {
    for (const auto& kv : params) {
        if (known.count(kv.first) == 0) {
            LOG_WARN("Strategy '{}': unknown parameter '{}' ignored", name, kv.first);
        }
    }
}

template <typename StrategyT, typename StrategyConfigT>
StrategyPtr build(const std::string& name, const ParamMap& params) {
    warnUnknownKeys(name, params, toParams(StrategyConfigT()));
    return std::make_shared<StrategyT>(fromParams<StrategyConfigT>(params));
}

} // namespace

const std::vector<std::string>& StrategyFactory::builtinNames() {
    static const std::vector<std::string> names{
        "breakout_expansion",
        "ema_momentum",
        "liquidity_sweep",
        "trend_continuation"
    };
    return names;
}

bool StrategyFactory::isBuiltin(const std::string& name) {
    const auto& names = builtinNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

StrategyPtr StrategyFactory::create(const std::string& name, const ParamMap& params) {
    if (name == "ema_momentum") {
        return build<EmaMomentumStrategy, EmaMomentumStrategyConfig>(name, params);
    }
    if (name == "trend_continuation") {
        return build<TrendContinuationStrategy, TrendContinuationStrategyConfig>(name, params);
    }
    if (name == "breakout_expansion") {
        return build<BreakoutExpansionStrategy, BreakoutExpansionStrategyConfig>(name, params);
    }
    if (name == "liquidity_sweep") {
        return build<LiquiditySweepStrategy, LiquiditySweepStrategyConfig>(name, params);
    }
    LOG_WARN("Unknown strategy '{}'", name);
    return nullptr;
}

ParamMap StrategyFactory::defaultParams(const std::string& name) {
    if (name == "ema_momentum") return toParams(EmaMomentumStrategyConfig());
    if (name == "trend_continuation") return toParams(TrendContinuationStrategyConfig());
    if (name == "breakout_expansion") return toParams(BreakoutExpansionStrategyConfig());
    if (name == "liquidity_sweep") return toParams(LiquiditySweepStrategyConfig());
    return ParamMap();
}

} // namespace strategy
} // namespace stratbench
