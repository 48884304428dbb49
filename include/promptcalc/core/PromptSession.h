#pragma once

#include "promptcalc/core/ErrorTypes.h"
#include "promptcalc/core/ModelLimitTracker.h"
#include "promptcalc/core/PromptOptimizer.h"
#include "promptcalc/core/types/ModelLimit.h"
#include "promptcalc/core/types/OptimizationResult.h"
#include "promptcalc/core/types/TextStats.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace promptcalc::core {

/**
 * @brief 当前模型下的 token 占用快照
 */
struct UsageSnapshot {
    std::string modelName;
    std::size_t tokens{0};
    std::uint64_t limit{0};
    double ratio{0.0};
    double percentage{0.0};
    std::uint64_t remaining{0};
    UsageBand band{UsageBand::Low};

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"model", modelName},
            {"tokens", tokens},
            {"limit", limit},
            {"ratio", ratio},
            {"percentage", percentage},
            {"remaining", remaining},
            {"band", usageBandToString(band)}
        };
    }
};

/**
 * @brief 调用方持有的提示词工作副本
 *
 * 保存当前文本、待确认的优化结果与选中的模型。核心函数不持有文本引用，
 * 所有状态都在这里；非线程安全，由单一调用方独占。
 */
class PromptSession {
public:
    // tracker/optimizer 的生命周期须长于 session
    PromptSession(const ModelLimitTracker& tracker, const PromptOptimizer& optimizer);

    void setText(std::string text);
    const std::string& text() const { return m_text; }

    // 每次调用都按当前文本重新计算
    types::TextStats stats() const;

    // 清空文本并丢弃待确认的优化结果
    void clear();

    // 对当前文本运行优化；空白文本返回 false 并填充 InvalidArgument
    bool optimize(ErrorInfo* err = nullptr);

    const std::optional<types::OptimizationResult>& pendingResult() const { return m_pending; }

    // 用优化后的文本替换工作副本；没有待确认结果时返回 false
    bool applyOptimization();
    void dismissOptimization();

    bool selectModel(std::size_t index, ErrorInfo* err = nullptr);
    bool selectModelByName(const std::string& name, ErrorInfo* err = nullptr);
    std::size_t selectedModelIndex() const { return m_selected; }
    types::ModelLimit currentModel() const;

    UsageSnapshot usage() const;

private:
    const ModelLimitTracker& m_tracker;
    const PromptOptimizer& m_optimizer;
    std::string m_text;
    std::optional<types::OptimizationResult> m_pending;
    std::size_t m_selected{0};
};

} // namespace promptcalc::core
