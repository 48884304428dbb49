#pragma once

#include "promptcalc/core/types/StrategyCategory.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace promptcalc::core::types {

/**
 * @brief 一次优化的不可变结果
 *
 * reduction 可以为 0 或负数（重写后估算反而变大）；
 * appliedStrategies 要么是实际改动了文本的类别（按执行顺序、不重复），
 * 要么是单元素 {NoOptimization}。
 */
struct OptimizationResult {
    std::string originalText;
    std::string optimizedText;
    std::size_t originalTokens{0};
    std::size_t optimizedTokens{0};
    std::int64_t reduction{0};
    double reductionPercentage{0.0};
    std::vector<StrategyCategory> appliedStrategies;

    bool hasOptimization() const {
        return !(appliedStrategies.size() == 1 &&
                 appliedStrategies.front() == StrategyCategory::NoOptimization);
    }

    bool applied(StrategyCategory c) const {
        return std::find(appliedStrategies.begin(), appliedStrategies.end(), c) != appliedStrategies.end();
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["original_text"] = originalText;
        j["optimized_text"] = optimizedText;
        j["original_tokens"] = originalTokens;
        j["optimized_tokens"] = optimizedTokens;
        j["reduction"] = reduction;
        j["reduction_percentage"] = reductionPercentage;
        nlohmann::json strategies = nlohmann::json::array();
        for (auto c : appliedStrategies) {
            strategies.push_back({
                {"key", strategyCategoryToString(c)},
                {"label", std::string(getStrategyCategoryLabel(c))}
            });
        }
        j["applied_strategies"] = std::move(strategies);
        return j;
    }
};

} // namespace promptcalc::core::types
