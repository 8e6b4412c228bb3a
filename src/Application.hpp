//
// getopt-driven base class of the command line tools
//

#ifndef OPLOGSYNC_APPLICATION_HPP
#define OPLOGSYNC_APPLICATION_HPP

#include <map>
#include <string>

namespace oplogsync {
    class Application {
    public:
        Application();
        virtual ~Application() = default;

        /**
         * parses argv with optString() and runs main().
         * @return process exit code
         */
        int exec(int argc, char **argv);

        /**
         * getopt(3) option string, e.g. "c:vh"
         */
        virtual std::string optString() = 0;
        virtual int main() = 0;

    protected:
        bool isArgSet(char option) const;
        std::string getArg(char option) const;

    private:
        std::map<char, std::string> _args;
    };
}

#endif //OPLOGSYNC_APPLICATION_HPP
