#include <gtest/gtest.h>

#include "nixbind/store/tests/test-main.hh"

using namespace nixbind;

int main(int argc, char ** argv)
{
    auto res = testMainForStoresPre(argc, argv);
    if (res)
        return res;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
