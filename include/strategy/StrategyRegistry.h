#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <map>
#include <string>
#include <vector>

namespace stratbench {
namespace strategy {

// Name-keyed set of strategies, populated once at startup.
class StrategyRegistry {
public:
    // Replaces any strategy already registered under the same name.
    void registerStrategy(StrategyPtr strategy);
    StrategyPtr get(const std::string& name) const;

    std::vector<std::string> names() const;
    std::vector<StrategyPtr> all() const;

    bool empty() const { return strategies_.empty(); }
    size_t size() const { return strategies_.size(); }
    void clear() { strategies_.clear(); }

    // Keeps only the listed names; unknown names are logged and ignored.
    void retainOnly(const std::vector<std::string>& names);

    // Every shipped strategy, with per-strategy parameter overrides by name.
    void registerBuiltins(const std::map<std::string, ParamMap>& params = {});

private:
    std::map<std::string, StrategyPtr> strategies_;
};

} // namespace strategy
} // namespace stratbench
