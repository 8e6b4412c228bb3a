//
// getopt-driven base class of the command line tools
//

#include <iostream>

#include <getopt.h>

#include "Application.hpp"

namespace oplogsync {
    Application::Application() {
    }

    int Application::exec(int argc, char **argv) {
        const auto options = optString();
        int option = 0;

        optind = 1;
        while ((option = getopt(argc, argv, options.c_str())) != -1) {
            if (option == '?' || option == ':') {
                std::cerr << "invalid arguments; try -h" << std::endl;
                return 1;
            }

            _args[static_cast<char>(option)] = optarg != nullptr ? std::string(optarg) : std::string();
        }

        return main();
    }

    bool Application::isArgSet(char option) const {
        return _args.find(option) != _args.end();
    }

    std::string Application::getArg(char option) const {
        auto it = _args.find(option);
        if (it == _args.end()) {
            return {};
        }

        return it->second;
    }
}
