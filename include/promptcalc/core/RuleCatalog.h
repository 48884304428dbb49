#pragma once

#include "promptcalc/core/types/StrategyCategory.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace promptcalc::core {

/**
 * @brief 单条重写规则：纯函数 string -> string，附带类别标签
 *
 * category 为空表示不计入策略列表的规范化步骤（空白归一）。
 */
struct RewriteRule {
    std::string name;
    std::optional<types::StrategyCategory> category;
    std::function<std::string(const std::string&)> apply;
};

/**
 * @brief 固定顺序的重写规则目录
 *
 * 顺序：whitespace -> redundancy -> simplification -> filler -> (归一)
 *       -> punctuation -> voice -> (归一)。
 * 后面的规则依赖前面规则完成的空白规范化，顺序不可调整。
 */
class RuleCatalog {
public:
    // 内置目录（进程内只构建一次，之后只读）
    static const RuleCatalog& builtin();

    const std::vector<RewriteRule>& rules() const { return m_rules; }

    // 某类别下的规则名（按执行顺序）
    std::vector<std::string> ruleNames(types::StrategyCategory category) const;

    // 依次应用某类别的全部规则
    std::string applyCategory(types::StrategyCategory category, const std::string& text) const;

    // 把所有空白串压成单个空格并去首尾空白
    static std::string normalizeWhitespace(const std::string& text);

    // [{"name":..., "category":...}, ...]，用于审计/展示
    nlohmann::json toJson() const;

private:
    RuleCatalog();

    std::vector<RewriteRule> m_rules;
};

} // namespace promptcalc::core
