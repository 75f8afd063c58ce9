#pragma once
///@file

#include "nixbind/store/store.hh"

#include <gtest/gtest.h>

#include <string>

namespace nixbind {

/**
 * A fixture that can open local stores under a fresh temporary
 * directory, which is removed again when the test ends.
 */
class LocalStoreTest : public ::testing::Test
{
public:

    ~LocalStoreTest() override;

    std::string nixDir;
    std::string nixStoreDir;
    std::string nixStateDir;
    std::string nixLogDir;

protected:

    /**
     * Open a `local` store rooted in the temporary directory. The
     * directory is created on the first call.
     */
    Store openLocalStore();
};

} // namespace nixbind
