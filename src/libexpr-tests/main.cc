#include <cstdlib>

#include <gtest/gtest.h>

#include "nixbind/expr/init.hh"
#include "nixbind/util/error.hh"
#include "nixbind/store/tests/test-main.hh"
#include "nixbind/util/logging.hh"

using namespace nixbind;

int main(int argc, char ** argv)
{
    auto res = testMainForStoresPre(argc, argv);
    if (res)
        return res;

    /* The collector must be initialised on the main thread. */
    try {
        ensureInitialized();
    } catch (InitError & e) {
        printError("%s", e.msg());
        return EXIT_FAILURE;
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
