#pragma once
///@file

namespace nixbind {

/**
 * Call this from the `main` of a test suite that opens stores, before
 * running tests.
 */
int testMainForStoresPre(int argc, char ** argv);

} // namespace nixbind
