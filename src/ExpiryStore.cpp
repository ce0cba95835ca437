#include "clipexpire/ExpiryStore.hpp"

namespace clipexpire {

bool ExpiryStore::observe(Fingerprint fp, TimePoint now) {
    return m_firstSeen.emplace(fp, now).second;
}

std::optional<ExpiryStore::Duration> ExpiryStore::ageOf(Fingerprint fp, TimePoint now) const {
    auto it = m_firstSeen.find(fp);
    if (it == m_firstSeen.end()) return std::nullopt;
    return now - it->second;
}

void ExpiryStore::drop(Fingerprint fp) {
    m_firstSeen.erase(fp);
}

std::size_t ExpiryStore::reconcile(const std::unordered_set<Fingerprint>& live) {
    std::size_t dropped = 0;
    for (auto it = m_firstSeen.begin(); it != m_firstSeen.end();) {
        if (live.count(it->first) == 0) {
            it = m_firstSeen.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace clipexpire
