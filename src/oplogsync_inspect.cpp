#include <iostream>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <nlohmann/json.hpp>

#include "base/Errors.hpp"
#include "checkpoint/CheckpointStore.hpp"
#include "config/ConnectorConfig.hpp"
#include "namespace/NamespaceMapper.hpp"

#include "utils/log.hpp"

#include "Application.hpp"

using namespace oplogsync;

class InspectApp: public oplogsync::Application {
public:
    InspectApp():
        Application(),
        _logger(createLogger("oplogsync-inspect"))
    {
    }

    std::string optString() override {
        return "c:m:u:d:p:PvVh";
    }

    int main() override {
        if (isArgSet('h') || !isArgSet('c')) {
            std::cout <<
            "oplogsync-inspect - namespace routing / checkpoint inspector\n"
            "\n"
            "Usage: oplogsync-inspect -c CONFIG_FILE [options]\n"
            "\n"
            "Options:\n"
            "    -c file        JSON config file path (required)\n"
            "    -m namespace   print the target namespace of a source namespace\n"
            "    -u namespace   print the source namespace of a target namespace\n"
            "    -d database    print every target database of a source database\n"
            "    -p namespace   print the mandatory field projection of a source namespace\n"
            "    -P             print the checkpoints stored in the configured oplogFile\n"
            "    -v             set logger level to DEBUG\n"
            "    -V             set logger level to TRACE\n"
            "    -h             print this help and exit\n";

            return isArgSet('h') ? 0 : 1;
        }

        auto configOpt = config::ConnectorConfig::loadFromFile(getArg('c'));
        if (!configOpt) {
            _logger->error("failed to load config file");
            return 1;
        }
        const auto &config = *configOpt;

        setLogLevel(spdlog::level::from_str(config.logLevel));

        if (isArgSet('v')) {
            setLogLevel(spdlog::level::debug);
        }

        if (isArgSet('V')) {
            setLogLevel(spdlog::level::trace);
        }

        try {
            routing::NamespaceMapper mapper(config.mapping);

            if (isArgSet('m')) {
                auto target = mapper.mapNamespace(getArg('m'));
                std::cout << getArg('m') << " -> " << target.value_or("(dropped)") << std::endl;
            }

            if (isArgSet('u')) {
                auto source = mapper.unmap(getArg('u'));
                std::cout << getArg('u') << " <- " << source.value_or("(unknown)") << std::endl;
            }

            if (isArgSet('d')) {
                auto databases = mapper.mapDatabase(getArg('d'));
                std::cout << fmt::format("{} -> {}", getArg('d'), databases) << std::endl;
            }

            if (isArgSet('p')) {
                auto projection = mapper.projection(getArg('p'), std::nullopt);

                if (!projection.has_value()) {
                    std::cout << getArg('p') << ": (dropped)" << std::endl;
                } else {
                    nlohmann::json document(*projection);
                    std::cout << getArg('p') << ": " << document.dump() << std::endl;
                }
            }
        } catch (const ConfigurationError &e) {
            _logger->error("invalid namespace configuration: {}", e.what());
            return 1;
        }

        if (isArgSet('P')) {
            if (config.oplogFile.empty()) {
                _logger->error("oplogFile is not configured");
                return 1;
            }

            checkpoint::CheckpointStore store(config.oplogFile);
            store.load();

            for (const auto &[name, timestamp]: store.snapshot()) {
                std::cout << fmt::format("{}\t{}\t{}", name, timestamp.toString(), timestamp.toInt64()) << std::endl;
            }
        }

        return 0;
    }

private:
    LoggerPtr _logger;
};

int main(int argc, char **argv) {
    InspectApp application;
    return application.exec(argc, argv);
}
