#include "promptcalc/core/PromptSession.h"

#include "promptcalc/core/ErrorHandler.h"
#include "promptcalc/core/utils/TokenEstimator.h"

#include <utility>

namespace promptcalc::core {

PromptSession::PromptSession(const ModelLimitTracker& tracker, const PromptOptimizer& optimizer)
    : m_tracker(tracker)
    , m_optimizer(optimizer)
{}

void PromptSession::setText(std::string text) {
    m_text = std::move(text);
}

types::TextStats PromptSession::stats() const {
    return utils::computeStats(m_text);
}

void PromptSession::clear() {
    m_text.clear();
    m_pending.reset();
}

bool PromptSession::optimize(ErrorInfo* err) {
    auto result = m_optimizer.optimize(m_text, err);
    if (!result.has_value()) {
        return false;
    }
    m_pending = std::move(result);
    return true;
}

bool PromptSession::applyOptimization() {
    if (!m_pending.has_value()) return false;
    m_text = m_pending->optimizedText;
    m_pending.reset();
    return true;
}

void PromptSession::dismissOptimization() {
    m_pending.reset();
}

bool PromptSession::selectModel(std::size_t index, ErrorInfo* err) {
    if (!m_tracker.at(index, err).has_value()) return false;
    m_selected = index;
    return true;
}

bool PromptSession::selectModelByName(const std::string& name, ErrorInfo* err) {
    auto idx = m_tracker.find(name);
    if (!idx.has_value()) {
        ErrorHandler::fill(err, ErrorType::InvalidArgument, "Unknown model: " + name);
        return false;
    }
    m_selected = *idx;
    return true;
}

types::ModelLimit PromptSession::currentModel() const {
    // 越界时回退到首项；目录为空时返回空条目
    auto m = m_tracker.at(m_selected);
    if (m.has_value()) return *m;
    return m_tracker.listModelLimits().empty() ? types::ModelLimit{} : m_tracker.listModelLimits().front();
}

UsageSnapshot PromptSession::usage() const {
    const auto model = currentModel();
    UsageSnapshot u;
    u.modelName = model.name;
    u.tokens = utils::estimateTokensAdvanced(m_text);
    u.limit = model.limit;
    u.ratio = ModelLimitTracker::usageRatio(u.tokens, u.limit);
    u.percentage = ModelLimitTracker::usagePercentage(u.tokens, u.limit);
    u.remaining = ModelLimitTracker::remaining(u.tokens, u.limit);
    u.band = ModelLimitTracker::usageBand(u.percentage);
    return u;
}

} // namespace promptcalc::core
