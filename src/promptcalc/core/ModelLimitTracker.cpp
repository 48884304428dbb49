#include "promptcalc/core/ModelLimitTracker.h"

#include "promptcalc/core/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace promptcalc::core {

namespace {
std::string toLowerCopy(const std::string& in) {
    std::string out = in;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
} // namespace

ModelLimitTracker::ModelLimitTracker()
    : m_limits(defaultModelLimits())
{}

ModelLimitTracker::ModelLimitTracker(std::vector<types::ModelLimit> limits)
    : m_limits(std::move(limits))
{}

std::vector<types::ModelLimit> ModelLimitTracker::defaultModelLimits() {
    return {
        {"GPT-3.5 Turbo", 4096},
        {"GPT-4", 8192},
        {"GPT-4 Turbo", 32768},
        {"Claude 3 Sonnet", 200000},
    };
}

bool ModelLimitTracker::loadFromConfig(const ConfigManager& config, ErrorInfo* err) {
    auto node = config.get("model_limits");
    if (!node.has_value() || !node->is_array()) {
        ErrorHandler::fill(err, ErrorType::ConfigError, "Config 'model_limits' node is missing or not an array");
        return false;
    }

    std::vector<types::ModelLimit> loaded;
    std::vector<std::string> errors;
    for (size_t i = 0; i < node->size(); ++i) {
        auto m = types::ModelLimit::fromJson((*node)[i]);
        if (!m.has_value()) {
            errors.push_back("model_limits[" + std::to_string(i) + "]: failed to parse");
            continue;
        }
        std::vector<std::string> validationErrors;
        if (!m->isValid(&validationErrors)) {
            for (const auto& e : validationErrors) {
                errors.push_back("model_limits[" + std::to_string(i) + "]: " + e);
            }
            continue;
        }
        loaded.push_back(std::move(*m));
    }

    if (loaded.empty()) {
        ErrorHandler::fill(err, ErrorType::ConfigError,
                           "Failed to load any model limits" + (errors.empty() ? std::string() : ": " + errors[0]),
                           nlohmann::json{{"errors", errors}});
        return false;
    }

    if (!errors.empty()) {
        ErrorHandler::fill(err, ErrorType::ConfigError,
                           "Loaded " + std::to_string(loaded.size()) + " model limits with " +
                               std::to_string(errors.size()) + " errors",
                           nlohmann::json{{"errors", errors}});
    }

    m_limits = std::move(loaded);
    return true;
}

std::optional<types::ModelLimit> ModelLimitTracker::at(std::size_t index, ErrorInfo* err) const {
    if (index >= m_limits.size()) {
        ErrorHandler::fill(err, ErrorType::InvalidArgument,
                           "Model index out of range: " + std::to_string(index),
                           nlohmann::json{{"index", index}, {"size", m_limits.size()}});
        return std::nullopt;
    }
    return m_limits[index];
}

std::optional<std::size_t> ModelLimitTracker::find(const std::string& name) const {
    const auto key = toLowerCopy(name);
    for (std::size_t i = 0; i < m_limits.size(); ++i) {
        if (toLowerCopy(m_limits[i].name) == key) return i;
    }
    return std::nullopt;
}

double ModelLimitTracker::usageRatio(std::size_t tokens, std::uint64_t limit) {
    if (limit == 0) return 0.0;
    return static_cast<double>(tokens) / static_cast<double>(limit);
}

std::uint64_t ModelLimitTracker::remaining(std::size_t tokens, std::uint64_t limit) {
    const auto t = static_cast<std::uint64_t>(tokens);
    return t >= limit ? 0 : limit - t;
}

double ModelLimitTracker::usagePercentage(std::size_t tokens, std::uint64_t limit) {
    return usageRatio(tokens, limit) * 100.0;
}

UsageBand ModelLimitTracker::usageBand(double percentage) {
    if (percentage < 50.0) return UsageBand::Low;
    if (percentage < 80.0) return UsageBand::Moderate;
    return UsageBand::High;
}

} // namespace promptcalc::core
