#include <cstdlib>

#include "nixbind/store/store.hh"
#include "nixbind/store/tests/test-main.hh"
#include "nixbind/util/engine-settings.hh"
#include "nixbind/util/logging.hh"

namespace nixbind {

int testMainForStoresPre(int argc, char ** argv)
{
    try {
        ensureLibStoreInitialized();

        // No substituters, unless a test specifically requests.
        setEngineSetting("substituters", "");
    } catch (BaseError & e) {
        printError("test setup failed: %s", e.msg());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} // namespace nixbind
