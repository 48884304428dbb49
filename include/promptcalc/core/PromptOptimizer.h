#pragma once

#include "promptcalc/core/ConfigManager.h"
#include "promptcalc/core/ErrorHandler.h"
#include "promptcalc/core/ErrorTypes.h"
#include "promptcalc/core/RuleCatalog.h"
#include "promptcalc/core/types/OptimizationResult.h"
#include "promptcalc/core/types/StrategyCategory.h"

#include <optional>
#include <string>
#include <vector>

namespace promptcalc::core {

/**
 * @brief 提示词优化流水线
 *
 * 按 RuleCatalog 的固定顺序对文本副本应用重写规则，记录实际改动文本的类别，
 * 并用综合估算比较前后的 token 数。同步、确定性，不修改调用方的文本。
 */
class PromptOptimizer {
public:
    // 启用全部类别
    PromptOptimizer();
    explicit PromptOptimizer(std::vector<types::StrategyCategory> enabled);

    // 读取 optimizer.enabled_strategies；未配置时保持全部启用
    bool loadFromConfig(const ConfigManager& config, ErrorInfo* err = nullptr);

    // 可选：调试日志输出（不持有所有权）
    void setLogger(const ErrorHandler* logger) { m_logger = logger; }

    bool isEnabled(types::StrategyCategory category) const;
    const std::vector<types::StrategyCategory>& enabledStrategies() const { return m_enabled; }

    /**
     * @brief 运行流水线
     * @param text 原始文本；去首尾空白后不能为空
     * @param err  前置条件不满足时填充 InvalidArgument
     * @return 空白输入返回 nullopt（不运行流水线），否则返回不可变结果
     */
    std::optional<types::OptimizationResult> optimize(const std::string& text, ErrorInfo* err = nullptr) const;

private:
    const RuleCatalog& m_catalog;
    std::vector<types::StrategyCategory> m_enabled;
    const ErrorHandler* m_logger{nullptr};
};

} // namespace promptcalc::core
