#pragma once
// Single Responsibility: Removing entries from a manager that can only clear and re-add

#include "ClipboardGateway.hpp"
#include "ClipboardItem.hpp"
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace clipexpire {

struct RewritePlan {
    std::vector<std::string> survivors;      // oldest first, the order to re-add them
    std::vector<RemoveResult> results;       // one per requested item
    std::unordered_set<std::string> removed; // contents actually present and dropped

    bool needsRewrite() const { return !removed.empty(); }
    bool removes(const std::string& content) const { return removed.count(content) != 0; }
};

// What a rewrite needs from the clipboard manager. Each call throws
// GatewayError on failure.
struct HistoryWriter {
    std::function<void()> clear;
    std::function<void(const std::string&)> add;         // becomes the newest entry
    std::function<std::string()> selection;              // optional
};

// `history` is newest first, as listed. Every copy of a requested content
// goes; requests absent from the history are NotFound.
RewritePlan planRewrite(const std::vector<ClipboardItem>& history,
                        const std::vector<ClipboardItem>& targets);

// Clear the history and re-add the survivors. A failed add is retried up to
// `attempts` times in total and the remaining survivors are still re-added,
// so one bad call loses at most that entry. Throws GatewayError naming how
// many entries could not be restored.
void applyRewrite(const RewritePlan& plan, const HistoryWriter& writer, int attempts = 2);

} // namespace clipexpire
