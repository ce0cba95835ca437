// Clear-and-rebuild removal for clipboard managers without a per-entry delete.
// One rewrite covers every removal of a tick.

#include "clipexpire/HistoryRewrite.hpp"
#include "clipexpire/Errors.hpp"
#include <spdlog/spdlog.h>

namespace clipexpire {

RewritePlan planRewrite(const std::vector<ClipboardItem>& history,
                        const std::vector<ClipboardItem>& targets) {
    std::unordered_set<std::string> present;
    for (const auto& entry : history) {
        present.insert(entry.content);
    }

    RewritePlan plan;
    plan.results.reserve(targets.size());
    for (const auto& target : targets) {
        if (present.count(target.content) != 0) {
            plan.removed.insert(target.content);
            plan.results.push_back(RemoveResult::Removed);
        } else {
            plan.results.push_back(RemoveResult::NotFound);
        }
    }

    if (!plan.needsRewrite()) return plan;

    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (!plan.removes(it->content)) {
            plan.survivors.push_back(it->content);
        }
    }
    return plan;
}

namespace {

bool addWithRetry(const HistoryWriter& writer, const std::string& content, int attempts) {
    for (int attempt = 1; attempt <= attempts; attempt++) {
        try {
            writer.add(content);
            return true;
        } catch (const GatewayError& e) {
            spdlog::warn("restoring clipboard entry {:016x} failed (attempt {}/{}): {}",
                         fingerprintOf(content), attempt, attempts, e.what());
        }
    }
    return false;
}

} // namespace

void applyRewrite(const RewritePlan& plan, const HistoryWriter& writer, int attempts) {
    if (!plan.needsRewrite()) return;

    // Nothing is lost if this throws
    writer.clear();

    std::size_t lost = 0;
    for (const auto& content : plan.survivors) {
        if (!addWithRetry(writer, content, attempts)) {
            ++lost;
        }
    }
    if (lost > 0) {
        throw GatewayError("rewriting clipboard history: " + std::to_string(lost) + " of " +
                           std::to_string(plan.survivors.size()) + " entries could not be restored");
    }
    spdlog::trace("rewrote clipboard history: {} removed, {} restored",
                  plan.removed.size(), plan.survivors.size());

    // The newest survivor was added last and should now be the selection.
    // If the manager still serves removed content, hand it the survivor again.
    if (!writer.selection) return;
    try {
        if (plan.removes(writer.selection())) {
            if (plan.survivors.empty()) {
                spdlog::warn("removed clipboard content is still the active selection");
            } else {
                writer.add(plan.survivors.back());
            }
        }
    } catch (const GatewayError& e) {
        spdlog::warn("checking clipboard selection after rewrite failed: {}", e.what());
    }
}

} // namespace clipexpire
