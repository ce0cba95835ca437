// Single Responsibility: Deny/keep pattern policy

#include "clipexpire/PatternFilter.hpp"
#include "clipexpire/Errors.hpp"
#include <algorithm>

namespace clipexpire {

const char* toString(Classification c) {
    switch (c) {
        case Classification::Deny: return "deny";
        case Classification::Keep: return "keep";
        case Classification::Neutral: return "neutral";
    }
    return "unknown";
}

PatternFilter::PatternFilter(std::vector<Pattern> deny, std::vector<Pattern> keep)
    : m_deny(std::move(deny)), m_keep(std::move(keep)) {
}

PatternFilter PatternFilter::compile(const std::vector<std::string>& deny,
                                     const std::vector<std::string>& keep) {
    return PatternFilter(compileSet(deny, "always_remove_patterns"),
                         compileSet(keep, "never_remove_patterns"));
}

std::vector<PatternFilter::Pattern> PatternFilter::compileSet(const std::vector<std::string>& patterns,
                                                              const std::string& key) {
    std::vector<Pattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& source : patterns) {
        try {
            compiled.push_back({source, std::regex(source, std::regex::ECMAScript | std::regex::optimize)});
        } catch (const std::regex_error& e) {
            throw InvalidPattern(key, source, e.what());
        }
    }
    return compiled;
}

bool PatternFilter::anyMatch(const std::vector<Pattern>& set, const std::string& text) {
    return std::any_of(set.begin(), set.end(), [&](const Pattern& p) {
        return std::regex_search(text, p.regex);
    });
}

bool PatternFilter::matchesDeny(const std::string& text) const {
    return anyMatch(m_deny, text);
}

bool PatternFilter::matchesKeep(const std::string& text) const {
    return anyMatch(m_keep, text);
}

Classification PatternFilter::classify(const std::string& text) const {
    // Deny first: an explicit removal rule beats protection
    if (matchesDeny(text)) return Classification::Deny;
    if (matchesKeep(text)) return Classification::Keep;
    return Classification::Neutral;
}

} // namespace clipexpire
