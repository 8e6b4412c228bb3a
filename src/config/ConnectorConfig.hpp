//
// JSON configuration of the routing and checkpoint components
//

#ifndef OPLOGSYNC_CONFIG_CONNECTORCONFIG_HPP
#define OPLOGSYNC_CONFIG_CONNECTORCONFIG_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oplogsync::config {

    /**
     * value of one "namespaces.mapping" entry; a plain string value only sets `rename`.
     * an empty field list means "no restriction".
     */
    struct NamespaceRule {
        std::optional<std::string> rename;
        std::vector<std::string> includeFields;
        std::vector<std::string> excludeFields;
    };

    struct MappingConfig {
        std::vector<std::string> include;
        std::vector<std::string> exclude;
        std::vector<std::pair<std::string, NamespaceRule>> mapping;

        // global defaults, applied to namespaces without fields of their own
        std::vector<std::string> includeFields;
        std::vector<std::string> excludeFields;
    };

    struct ConnectorConfig {
        std::string oplogFile;  // empty = checkpoints are not persisted
        MappingConfig mapping;
        std::string logLevel = "info";  // "trace" | "debug" | "info" | "warn" | "error" | "off"

        static std::optional<ConnectorConfig> loadFromFile(const std::string &path);
        static std::optional<ConnectorConfig> loadFromString(const std::string &jsonStr);
    };

} // namespace oplogsync::config

#endif // OPLOGSYNC_CONFIG_CONNECTORCONFIG_HPP
