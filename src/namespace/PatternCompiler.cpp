//
// Compiles "db_*.coll" style namespace patterns into anchored regexes
//

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "utils/StringUtil.hpp"

#include "PatternCompiler.hpp"

namespace {
    const std::string REGEX_SPECIAL_CHARS = "\\^$.|?*+()[]{}";

    std::string escapeLiteral(const std::string &literal) {
        std::string escaped;
        escaped.reserve(literal.size() * 2);

        for (char c: literal) {
            if (REGEX_SPECIAL_CHARS.find(c) != std::string::npos) {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }

        return escaped;
    }
}

namespace oplogsync::routing {
    bool isWildcard(const std::string &ns) {
        return ns.find(WILDCARD) != std::string::npos;
    }

    CompiledPattern::CompiledPattern(const std::string &pattern):
        _pattern(pattern),
        _isLiteral(!isWildcard(pattern)),
        _regex(buildExpression(pattern))
    {
    }

    std::string CompiledPattern::buildExpression(const std::string &pattern) {
        auto wildcards = utility::countChar(pattern, WILDCARD);
        if (wildcards > 1) {
            throw ConfigurationError(fmt::format(
                "namespace '{}' contains more than one '{}'", pattern, WILDCARD
            ));
        }

        auto starPos = pattern.find(WILDCARD);
        if (starPos == std::string::npos) {
            return escapeLiteral(pattern);
        }

        auto dotPos = pattern.find('.');
        // database names cannot contain a period
        const char *group = (dotPos != std::string::npos && starPos < dotPos) ? "([^.]*)" : "(.*)";

        return escapeLiteral(pattern.substr(0, starPos)) + group + escapeLiteral(pattern.substr(starPos + 1));
    }

    const std::string &CompiledPattern::pattern() const {
        return _pattern;
    }

    bool CompiledPattern::isLiteral() const {
        return _isLiteral;
    }

    bool CompiledPattern::matches(const std::string &ns) const {
        return boost::regex_match(ns, _regex);
    }

    std::optional<std::string> CompiledPattern::capture(const std::string &ns) const {
        boost::smatch what;

        if (!boost::regex_match(ns, what, _regex)) {
            return std::nullopt;
        }

        if (_isLiteral) {
            return std::string();
        }

        return what[1].str();
    }

    std::string CompiledPattern::substitute(const std::string &templateNs, const std::string &captured) {
        return utility::replaceAll(templateNs, std::string(1, WILDCARD), captured);
    }

    bool CompiledPattern::operator<(const CompiledPattern &other) const {
        return _pattern < other._pattern;
    }

    bool CompiledPattern::operator==(const CompiledPattern &other) const {
        return _pattern == other._pattern;
    }
}
