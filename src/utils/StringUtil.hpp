//
// String helpers for "database.collection" namespaces
//

#ifndef OPLOGSYNC_UTILS_STRINGUTIL_HPP
#define OPLOGSYNC_UTILS_STRINGUTIL_HPP

#include <string>
#include <utility>

namespace oplogsync::utility {
    /**
     * splits a namespace at its first period.
     * "db.coll.sub" -> {"db", "coll.sub"}, "db" -> {"db", ""}
     */
    std::pair<std::string, std::string> splitNamespace(const std::string &ns);

    std::string databaseName(const std::string &ns);

    std::string replaceAll(const std::string &source, const std::string &from, const std::string &to);

    size_t countChar(const std::string &source, char character);

    std::string toLower(const std::string &source);
}


#endif //OPLOGSYNC_UTILS_STRINGUTIL_HPP
