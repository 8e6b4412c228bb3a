//
// JSON configuration of the routing and checkpoint components
//

#include "config/ConnectorConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"
#include "utils/StringUtil.hpp"

namespace oplogsync::config {

    namespace {
        LoggerPtr logger = createLogger("ConnectorConfig");

        std::string getEnvString(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) {
                return {};
            }
            return std::string(value);
        }

        bool readStringField(const nlohmann::json &obj, const char *key, std::string &out,
                             const std::string &path) {
            if (!obj.contains(key)) {
                return true;
            }

            const auto &value = obj.at(key);
            if (value.is_null()) {
                return true;
            }

            if (!value.is_string()) {
                logger->error("field must be a string: {}", path);
                return false;
            }

            out = value.get<std::string>();
            return true;
        }

        bool readStringArray(const nlohmann::json &obj, const char *key,
                             std::vector<std::string> &out, const std::string &path) {
            if (!obj.contains(key)) {
                return true;
            }

            const auto &value = obj.at(key);
            if (value.is_null()) {
                return true;
            }

            if (!value.is_array()) {
                logger->error("field must be an array: {}", path);
                return false;
            }

            std::vector<std::string> entries;
            for (const auto &item: value) {
                if (!item.is_string()) {
                    logger->error("array elements must be strings: {}", path);
                    return false;
                }
                entries.emplace_back(item.get<std::string>());
            }

            out = std::move(entries);
            return true;
        }

        bool readNamespaceRule(const std::string &source, const nlohmann::json &value, NamespaceRule &out) {
            const auto path = "namespaces.mapping." + source;

            if (value.is_string()) {
                out.rename = value.get<std::string>();
                return true;
            }

            if (!value.is_object()) {
                logger->error("mapping entry must be a string or an object: {}", path);
                return false;
            }

            if (value.contains("rename") && !value.at("rename").is_null()) {
                std::string rename;
                if (!readStringField(value, "rename", rename, path + ".rename")) {
                    return false;
                }
                out.rename = std::move(rename);
            }

            if (value.contains("includeFields") && value.contains("fields")) {
                logger->error("'fields' and 'includeFields' are aliases, use only one: {}", path);
                return false;
            }

            const char *includeKey = value.contains("fields") ? "fields" : "includeFields";
            if (!readStringArray(value, includeKey, out.includeFields, path + "." + includeKey)) {
                return false;
            }
            if (!readStringArray(value, "excludeFields", out.excludeFields, path + ".excludeFields")) {
                return false;
            }

            return true;
        }

        bool validateLogLevel(const std::string &value) {
            return value == "trace" || value == "debug" || value == "info" ||
                   value == "warn" || value == "error" || value == "off";
        }
    } // namespace

    std::optional<ConnectorConfig> ConnectorConfig::loadFromFile(const std::string &path) {
        std::ifstream inputStream(path);
        if (!inputStream.is_open()) {
            logger->error("failed to open config file: {}", path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << inputStream.rdbuf();
        inputStream.close();

        return loadFromString(buffer.str());
    }

    std::optional<ConnectorConfig> ConnectorConfig::loadFromString(const std::string &jsonStr) {
        using nlohmann::json;

        auto document = json::parse(jsonStr, nullptr, false);
        if (document.is_discarded()) {
            logger->error("failed to parse config JSON");
            return std::nullopt;
        }

        if (!document.is_object()) {
            logger->error("config JSON must be an object");
            return std::nullopt;
        }

        ConnectorConfig config;

        bool oplogFileProvided = document.contains("oplogFile");
        if (!readStringField(document, "oplogFile", config.oplogFile, "oplogFile")) {
            return std::nullopt;
        }

        if (document.contains("namespaces")) {
            const auto &namespacesObj = document.at("namespaces");
            if (!namespacesObj.is_object()) {
                logger->error("field must be an object: namespaces");
                return std::nullopt;
            }

            if (!readStringArray(namespacesObj, "include", config.mapping.include, "namespaces.include")) {
                return std::nullopt;
            }
            if (!readStringArray(namespacesObj, "exclude", config.mapping.exclude, "namespaces.exclude")) {
                return std::nullopt;
            }

            if (!config.mapping.include.empty() && !config.mapping.exclude.empty()) {
                logger->error("namespaces.include and namespaces.exclude cannot be used together");
                return std::nullopt;
            }

            if (namespacesObj.contains("mapping")) {
                const auto &mappingObj = namespacesObj.at("mapping");
                if (!mappingObj.is_object()) {
                    logger->error("field must be an object: namespaces.mapping");
                    return std::nullopt;
                }

                for (auto it = mappingObj.begin(); it != mappingObj.end(); ++it) {
                    NamespaceRule rule;
                    if (!readNamespaceRule(it.key(), it.value(), rule)) {
                        return std::nullopt;
                    }

                    config.mapping.mapping.emplace_back(it.key(), std::move(rule));
                }
            }
        }

        if (!readStringArray(document, "includeFields", config.mapping.includeFields, "includeFields")) {
            return std::nullopt;
        }
        if (!readStringArray(document, "excludeFields", config.mapping.excludeFields, "excludeFields")) {
            return std::nullopt;
        }

        if (!config.mapping.includeFields.empty() && !config.mapping.excludeFields.empty()) {
            logger->error("includeFields and excludeFields cannot be used together");
            return std::nullopt;
        }

        if (!readStringField(document, "logLevel", config.logLevel, "logLevel")) {
            return std::nullopt;
        }

        config.logLevel = utility::toLower(config.logLevel);
        if (!validateLogLevel(config.logLevel)) {
            logger->error("logLevel must be one of 'trace', 'debug', 'info', 'warn', 'error', 'off'");
            return std::nullopt;
        }

        if (!oplogFileProvided) {
            auto envPath = getEnvString("OPLOG_PROGRESS_FILE");
            if (!envPath.empty()) {
                config.oplogFile = envPath;
            }
        }

        return config;
    }

} // namespace oplogsync::config
