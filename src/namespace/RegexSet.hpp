//
// Set of literal namespaces and wildcard patterns
//

#ifndef OPLOGSYNC_NAMESPACE_REGEXSET_HPP
#define OPLOGSYNC_NAMESPACE_REGEXSET_HPP

#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "PatternCompiler.hpp"

namespace oplogsync::routing {
    class RegexSet {
    public:
        RegexSet() = default;

        static RegexSet fromNamespaces(const std::vector<std::string> &namespaces);

        /**
         * literal lookup first, then every compiled pattern in order.
         */
        bool contains(const std::string &ns) const;

        void add(const std::string &ns);
        void discard(const std::string &ns);

        bool empty() const;
        size_t size() const;

    private:
        std::unordered_set<std::string> _literals;
        std::set<CompiledPattern> _patterns;
    };
}

#endif //OPLOGSYNC_NAMESPACE_REGEXSET_HPP
