#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <string>
#include <vector>

namespace stratbench {
namespace strategy {

// Builds the shipped strategies by name from a parameter map.
class StrategyFactory {
public:
    static const std::vector<std::string>& builtinNames();
    static bool isBuiltin(const std::string& name);

    // nullptr for an unknown name. Parameters the strategy does not know
    // are logged and ignored.
    static StrategyPtr create(const std::string& name, const ParamMap& params = ParamMap());

    // Empty for an unknown name.
    static ParamMap defaultParams(const std::string& name);
};

} // namespace strategy
} // namespace stratbench
