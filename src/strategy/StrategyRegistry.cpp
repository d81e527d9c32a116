#include "strategy/StrategyRegistry.h"
#include "strategy/StrategyFactory.h"
#include "common/Logger.h"

#include <set>

namespace stratbench {
namespace strategy {

void StrategyRegistry::registerStrategy(StrategyPtr strategy) {
    if (!strategy) {
        LOG_WARN("Ignoring null strategy registration");
        return;
    }
    const auto name = strategy->name();
    if (strategies_.count(name) > 0) {
        LOG_WARN("Strategy '{}' registered twice, replacing", name);
    }
    strategies_[name] = std::move(strategy);
    LOG_DEBUG("Strategy registered: {}", name);
}

StrategyPtr StrategyRegistry::get(const std::string& name) const {
    auto it = strategies_.find(name);
    return it == strategies_.end() ? nullptr : it->second;
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(strategies_.size());
    for (const auto& kv : strategies_) {
        out.push_back(kv.first);
    }
    return out;
}

std::vector<StrategyPtr> StrategyRegistry::all() const {
    std::vector<StrategyPtr> out;
    out.reserve(strategies_.size());
    for (const auto& kv : strategies_) {
        out.push_back(kv.second);
    }
    return out;
}

void StrategyRegistry::retainOnly(const std::vector<std::string>& names) {
    const std::set<std::string> wanted(names.begin(), names.end());
    for (const auto& name : wanted) {
        if (strategies_.count(name) == 0) {
            LOG_WARN("Unknown strategy '{}' requested", name);
        }
    }
    for (auto it = strategies_.begin(); it != strategies_.end();) {
        if (wanted.count(it->first) == 0) {
            it = strategies_.erase(it);
        } else {
            ++it;
        }
    }
}

void StrategyRegistry::registerBuiltins(const std::map<std::string, ParamMap>& params) {
    for (const auto& kv : params) {
        if (!StrategyFactory::isBuiltin(kv.first)) {
            LOG_WARN("Parameters given for unknown strategy '{}'", kv.first);
        }
    }
    for (const auto& name : StrategyFactory::builtinNames()) {
        auto it = params.find(name);
        registerStrategy(StrategyFactory::create(name, it == params.end() ? ParamMap() : it->second));
    }
}

} // namespace strategy
} // namespace stratbench
