//
// Exception types shared by the routing and checkpoint components
//

#ifndef OPLOGSYNC_BASE_ERRORS_HPP
#define OPLOGSYNC_BASE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace oplogsync {
    /**
     * thrown when the namespace mapping configuration is inconsistent:
     * mixed include/exclude field scopes, malformed wildcards,
     * or two source namespaces resolving to one target namespace.
     */
    class ConfigurationError: public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string &message):
            std::runtime_error(message)
        {
        }
    };
}

#endif //OPLOGSYNC_BASE_ERRORS_HPP
