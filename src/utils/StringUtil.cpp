//
// String helpers for "database.collection" namespaces
//

#include <algorithm>
#include <cctype>

#include "StringUtil.hpp"

namespace oplogsync::utility {
    std::pair<std::string, std::string> splitNamespace(const std::string &ns) {
        auto pos = ns.find('.');

        if (pos == std::string::npos) {
            return std::make_pair(ns, std::string());
        }

        return std::make_pair(ns.substr(0, pos), ns.substr(pos + 1));
    }

    std::string databaseName(const std::string &ns) {
        return splitNamespace(ns).first;
    }

    std::string replaceAll(const std::string &source, const std::string &from, const std::string &to) {
        if (from.empty()) {
            return source;
        }

        std::string result;
        result.reserve(source.size());

        size_t lastPos = 0;
        size_t pos = 0;

        while ((pos = source.find(from, lastPos)) != std::string::npos) {
            result.append(source, lastPos, pos - lastPos);
            result += to;
            lastPos = pos + from.size();
        }

        result.append(source, lastPos, std::string::npos);
        return result;
    }

    size_t countChar(const std::string &source, char character) {
        return static_cast<size_t>(std::count(source.begin(), source.end(), character));
    }

    std::string toLower(const std::string &source) {
        std::string result(source);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        return result;
    }
}
