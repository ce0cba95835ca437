#pragma once
// Single Responsibility: Data structure for clipboard history items

#include <cstdint>
#include <string>
#include <vector>

namespace clipexpire {

// Stable identity of an item across polls. Klipper hands out no ids, so the
// content hash is the key; collisions are treated as the same item.
using Fingerprint = std::uint64_t;

struct ClipboardItem {
    std::string content;
    std::size_t position = 0;  // Index in the newest-first snapshot it came from

    bool operator==(const ClipboardItem& other) const { return content == other.content; }
};

// 64-bit FNV-1a over the raw content bytes
Fingerprint fingerprintOf(const std::string& content);

inline Fingerprint fingerprintOf(const ClipboardItem& item) {
    return fingerprintOf(item.content);
}

} // namespace clipexpire
