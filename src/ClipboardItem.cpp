#include "clipexpire/ClipboardItem.hpp"

namespace clipexpire {

Fingerprint fingerprintOf(const std::string& content) {
    constexpr Fingerprint OFFSET_BASIS = 14695981039346656037ULL;
    constexpr Fingerprint PRIME = 1099511628211ULL;

    Fingerprint hash = OFFSET_BASIS;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= PRIME;
    }
    return hash;
}

} // namespace clipexpire
