#pragma once

#include "promptcalc/core/ConfigManager.h"
#include "promptcalc/core/ErrorTypes.h"
#include "promptcalc/core/types/ModelLimit.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace promptcalc::core {

/**
 * @brief 占用比例分档（< 50% / < 80% / 其余）
 */
enum class UsageBand {
    Low,
    Moderate,
    High
};

inline const char* usageBandToString(UsageBand b) {
    switch (b) {
        case UsageBand::Low: return "low";
        case UsageBand::Moderate: return "moderate";
        case UsageBand::High: return "high";
    }
    return "unknown";
}

/**
 * @brief 模型 token 上限目录 + 占用计算
 *
 * 目录在构造/加载配置后只读；计算函数为纯函数。
 */
class ModelLimitTracker {
public:
    // 使用内置默认目录
    ModelLimitTracker();
    explicit ModelLimitTracker(std::vector<types::ModelLimit> limits);

    static std::vector<types::ModelLimit> defaultModelLimits();

    /**
     * @brief 用配置中的 model_limits 替换目录
     * @return 至少加载到一个有效条目时返回 true；否则保留原目录并返回 false
     */
    bool loadFromConfig(const ConfigManager& config, ErrorInfo* err = nullptr);

    const std::vector<types::ModelLimit>& listModelLimits() const { return m_limits; }
    std::size_t size() const { return m_limits.size(); }

    // 下标越界返回 nullopt，并填充 InvalidArgument
    std::optional<types::ModelLimit> at(std::size_t index, ErrorInfo* err = nullptr) const;

    // 名称大小写不敏感；返回下标
    std::optional<std::size_t> find(const std::string& name) const;

    // tokens / limit，可超过 1.0；limit 为 0 时返回 0
    static double usageRatio(std::size_t tokens, std::uint64_t limit);

    // max(0, limit - tokens)
    static std::uint64_t remaining(std::size_t tokens, std::uint64_t limit);

    static double usagePercentage(std::size_t tokens, std::uint64_t limit);

    static UsageBand usageBand(double percentage);

private:
    std::vector<types::ModelLimit> m_limits;
};

} // namespace promptcalc::core
