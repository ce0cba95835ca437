#pragma once
// Single Responsibility: Deny/keep pattern policy for clipboard content

#include "Forward.hpp"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace clipexpire {

enum class Classification {
    Deny,     // Remove as soon as it is seen
    Keep,     // Never removed for age
    Neutral   // Subject to the expiry window
};

const char* toString(Classification c);

// Compiled once at startup and never mutated. A config reload would build a
// new filter and swap the shared_ptr.
class PatternFilter {
public:
    struct Pattern {
        std::string source;
        std::regex regex;
    };

    // Throws InvalidPattern on the first pattern that fails to compile
    static PatternFilter compile(const std::vector<std::string>& deny,
                                 const std::vector<std::string>& keep);

    // Unanchored search against the raw text. Deny takes precedence over keep.
    Classification classify(const std::string& text) const;

    bool matchesDeny(const std::string& text) const;
    bool matchesKeep(const std::string& text) const;

    std::size_t denyCount() const { return m_deny.size(); }
    std::size_t keepCount() const { return m_keep.size(); }

private:
    PatternFilter(std::vector<Pattern> deny, std::vector<Pattern> keep);

    static std::vector<Pattern> compileSet(const std::vector<std::string>& patterns,
                                           const std::string& key);
    static bool anyMatch(const std::vector<Pattern>& set, const std::string& text);

    std::vector<Pattern> m_deny;
    std::vector<Pattern> m_keep;
};

using PatternFilterPtr = std::shared_ptr<const PatternFilter>;

} // namespace clipexpire
