//
// Compiles "db_*.coll" style namespace patterns into anchored regexes
//

#ifndef OPLOGSYNC_NAMESPACE_PATTERNCOMPILER_HPP
#define OPLOGSYNC_NAMESPACE_PATTERNCOMPILER_HPP

#include <optional>
#include <string>

#include <boost/regex.hpp>

namespace oplogsync::routing {
    constexpr char WILDCARD = '*';

    bool isWildcard(const std::string &ns);

    /**
     * a namespace pattern with at most one '*', compiled once.
     *
     * a '*' inside the database segment (before the first '.') never matches
     * a period; anywhere else it matches any sequence of characters.
     * every other character matches only itself.
     */
    class CompiledPattern {
    public:
        /**
         * @throws ConfigurationError if the pattern has more than one '*'
         */
        explicit CompiledPattern(const std::string &pattern);

        const std::string &pattern() const;
        bool isLiteral() const;

        bool matches(const std::string &ns) const;

        /**
         * returns the text the '*' consumed when `ns` matches, std::nullopt otherwise.
         * a literal pattern captures an empty string.
         */
        std::optional<std::string> capture(const std::string &ns) const;

        /**
         * replaces the '*' in `templateNs` with `captured`.
         * ("db_new_*.foo", "123") -> "db_new_123.foo"
         */
        static std::string substitute(const std::string &templateNs, const std::string &captured);

        bool operator<(const CompiledPattern &other) const;
        bool operator==(const CompiledPattern &other) const;

    private:
        static std::string buildExpression(const std::string &pattern);

        std::string _pattern;
        bool _isLiteral;
        boost::regex _regex;
    };
}

#endif //OPLOGSYNC_NAMESPACE_PATTERNCOMPILER_HPP
