//
// Set of literal namespaces and wildcard patterns
//

#include <algorithm>

#include "RegexSet.hpp"

namespace oplogsync::routing {
    RegexSet RegexSet::fromNamespaces(const std::vector<std::string> &namespaces) {
        RegexSet regexSet;

        for (const auto &ns: namespaces) {
            regexSet.add(ns);
        }

        return regexSet;
    }

    bool RegexSet::contains(const std::string &ns) const {
        if (_literals.find(ns) != _literals.end()) {
            return true;
        }

        return std::any_of(_patterns.begin(), _patterns.end(), [&ns](const CompiledPattern &pattern) {
            return pattern.matches(ns);
        });
    }

    void RegexSet::add(const std::string &ns) {
        if (isWildcard(ns)) {
            _patterns.emplace(ns);
        } else {
            _literals.insert(ns);
        }
    }

    void RegexSet::discard(const std::string &ns) {
        if (isWildcard(ns)) {
            auto it = std::find_if(_patterns.begin(), _patterns.end(), [&ns](const CompiledPattern &pattern) {
                return pattern.pattern() == ns;
            });

            if (it != _patterns.end()) {
                _patterns.erase(it);
            }
        } else {
            _literals.erase(ns);
        }
    }

    bool RegexSet::empty() const {
        return _literals.empty() && _patterns.empty();
    }

    size_t RegexSet::size() const {
        return _literals.size() + _patterns.size();
    }
}
