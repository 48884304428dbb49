#include "promptcalc/core/PromptOptimizer.h"

#include "promptcalc/core/utils/TokenEstimator.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace promptcalc::core {

using types::StrategyCategory;

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// 去重并按执行顺序排列
std::vector<StrategyCategory> canonicalOrder(const std::vector<StrategyCategory>& in) {
    std::vector<StrategyCategory> out;
    for (auto c : types::kAllStrategyCategories) {
        if (std::find(in.begin(), in.end(), c) != in.end()) out.push_back(c);
    }
    return out;
}

} // namespace

PromptOptimizer::PromptOptimizer()
    : m_catalog(RuleCatalog::builtin())
    , m_enabled(types::kAllStrategyCategories.begin(), types::kAllStrategyCategories.end())
{}

PromptOptimizer::PromptOptimizer(std::vector<StrategyCategory> enabled)
    : m_catalog(RuleCatalog::builtin())
    , m_enabled(canonicalOrder(enabled))
{}

bool PromptOptimizer::loadFromConfig(const ConfigManager& config, ErrorInfo* err) {
    auto node = config.get("optimizer.enabled_strategies");
    if (!node.has_value()) return true;
    if (!node->is_array()) {
        ErrorHandler::fill(err, ErrorType::ConfigError, "Config 'optimizer.enabled_strategies' must be an array");
        return false;
    }

    std::vector<StrategyCategory> enabled;
    for (const auto& item : *node) {
        std::optional<StrategyCategory> c;
        if (item.is_string()) c = types::stringToStrategyCategory(item.get<std::string>());
        if (!c.has_value() || *c == StrategyCategory::NoOptimization) {
            ErrorHandler::fill(err, ErrorType::ConfigError, "Unknown strategy in 'optimizer.enabled_strategies'",
                               nlohmann::json{{"entry", item}});
            return false;
        }
        enabled.push_back(*c);
    }
    m_enabled = canonicalOrder(enabled);
    return true;
}

bool PromptOptimizer::isEnabled(StrategyCategory category) const {
    return std::find(m_enabled.begin(), m_enabled.end(), category) != m_enabled.end();
}

std::optional<types::OptimizationResult> PromptOptimizer::optimize(const std::string& text, ErrorInfo* err) const {
    if (isBlank(text)) {
        ErrorHandler::fill(err, ErrorType::InvalidArgument, "Cannot optimize blank text");
        if (m_logger) m_logger->log(ErrorHandler::LogLevel::Debug, "optimize skipped: blank input");
        return std::nullopt;
    }

    types::OptimizationResult result;
    result.originalText = text;
    result.originalTokens = utils::estimateTokensAdvanced(text);

    // 相邻同类别规则视为一个 pass；以 pass 前后快照是否不同判定是否生效
    std::string working = text;
    const auto& rules = m_catalog.rules();
    for (std::size_t i = 0; i < rules.size();) {
        const auto category = rules[i].category;
        std::size_t j = i;
        while (j < rules.size() && rules[j].category == category) ++j;

        const bool run = !category.has_value() || isEnabled(*category);
        if (run) {
            const std::string before = working;
            for (std::size_t k = i; k < j; ++k) {
                working = rules[k].apply(working);
            }
            if (category.has_value() && working != before) {
                result.appliedStrategies.push_back(*category);
            }
        }
        i = j;
    }

    // 只有归一步骤改动文本时不算优化：保持原文，保证哨兵结果的 reduction 为 0
    if (result.appliedStrategies.empty()) {
        result.appliedStrategies.push_back(StrategyCategory::NoOptimization);
        working = text;
    }

    result.optimizedText = std::move(working);
    result.optimizedTokens = utils::estimateTokensAdvanced(result.optimizedText);
    result.reduction = static_cast<std::int64_t>(result.originalTokens) -
                       static_cast<std::int64_t>(result.optimizedTokens);
    result.reductionPercentage = result.originalTokens > 0
                                     ? static_cast<double>(result.reduction) * 100.0 /
                                           static_cast<double>(result.originalTokens)
                                     : 0.0;

    if (m_logger) {
        std::ostringstream oss;
        oss << "optimize: tokens " << result.originalTokens << " -> " << result.optimizedTokens
            << " strategies=[";
        for (std::size_t i = 0; i < result.appliedStrategies.size(); ++i) {
            if (i > 0) oss << ",";
            oss << types::strategyCategoryToString(result.appliedStrategies[i]);
        }
        oss << "]";
        m_logger->log(ErrorHandler::LogLevel::Debug, oss.str());
    }
    return result;
}

} // namespace promptcalc::core
