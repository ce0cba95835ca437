#pragma once
// Single Responsibility: IPC boundary to the external clipboard manager

#include "ClipboardItem.hpp"
#include <functional>
#include <string>
#include <vector>

namespace clipexpire {

enum class RemoveResult {
    Removed,
    NotFound   // Already gone; callers treat this as success
};

// Every call is bounded by a timeout. Unreachable manager, timeouts and
// remote errors throw GatewayError.
class ClipboardGateway {
public:
    virtual ~ClipboardGateway() = default;

    // Current history, newest first
    virtual std::vector<ClipboardItem> listHistory() = 0;

    // Remove entries by content identity in one operation. Returns one result
    // per item, in order.
    virtual std::vector<RemoveResult> remove(const std::vector<ClipboardItem>& items) = 0;

    // The active selection, tracked separately from history
    virtual std::string currentSelection() = 0;
    virtual void setSelection(const std::string& text) = 0;

    // Push notification when the manager's history changes. Returns false if
    // the manager offers none; callers then rely on polling alone.
    virtual bool subscribeHistoryChanged(std::function<void()> callback) = 0;
    virtual void unsubscribeHistoryChanged() = 0;
};

} // namespace clipexpire
