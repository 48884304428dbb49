#pragma once

#include "promptcalc/core/types/TextStats.h"

#include <cstddef>
#include <string_view>

namespace promptcalc::core::utils {

/**
 * @brief 文本 token 估算（纯函数，无状态）
 *
 * 三种互相独立的近似：
 *  - 字符估算：约 4 字符 1 token
 *  - 词估算：约 0.75 词 1 token
 *  - 综合估算：标点、换行/制表符额外加权，除数 3.8；这是系统其余部分统一使用的口径
 *
 * 所有估算向上取整；空串的 token 数为 0，行数为 1。
 */

// Unicode 标量值个数（按 UTF-8 解码；非法字节各计 1）
std::size_t charCount(std::string_view text);

// 去首尾空白后为空则为 0，否则按连续空白切分后的段数
std::size_t wordCount(std::string_view text);

// 1 + 换行符个数
std::size_t lineCount(std::string_view text);

std::size_t estimateTokensCharBased(std::string_view text);
std::size_t estimateTokensWordBased(std::string_view text);
std::size_t estimateTokensAdvanced(std::string_view text);

types::TextStats computeStats(std::string_view text);

} // namespace promptcalc::core::utils
