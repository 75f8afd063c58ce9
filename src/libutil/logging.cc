#include "nixbind/util/logging.hh"

#include <cerrno>
#include <unistd.h>

namespace nixbind {

Verbosity verbosity = lvlInfo;

namespace {

class SimpleLogger : public Logger
{
public:

    void log(Verbosity lvl, std::string_view s) override
    {
        std::string line(s);
        line += '\n';

        std::string_view rest = line;
        while (!rest.empty()) {
            auto n = ::write(STDERR_FILENO, rest.data(), rest.size());
            if (n == -1) {
                if (errno == EINTR)
                    continue;
                /* stderr is gone; there is nowhere to report that. */
                return;
            }
            rest.remove_prefix(n);
        }
    }
};

} // namespace

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

} // namespace nixbind
