#include "nixbind/store/tests/store.hh"
#include "nixbind/util/error.hh"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace nixbind {

LocalStoreTest::~LocalStoreTest()
{
    if (nixDir.empty())
        return;
    std::error_code ec;
    if (std::filesystem::exists(nixDir, ec)) {
        /* The store makes its contents read-only. */
        for (auto & path : std::filesystem::recursive_directory_iterator(nixDir, ec))
            std::filesystem::permissions(path, std::filesystem::perms::owner_all, ec);
        std::filesystem::remove_all(nixDir, ec);
    }
}

Store LocalStoreTest::openLocalStore()
{
    if (nixDir.empty()) {
        /* Resolve symlinks (e.g. /tmp -> /private/tmp on macOS), which
           are not allowed in a store path. */
        auto tmpl = (std::filesystem::canonical(std::filesystem::temp_directory_path()) / "tests_nixbind-store.XXXXXX")
                        .string();
        if (!mkdtemp(tmpl.data()))
            throw Error("creating temporary directory '%s': %s", tmpl, std::strerror(errno));
        nixDir = tmpl;

        nixStoreDir = nixDir + "/my_nix_store";
        nixStateDir = nixDir + "/my_state";
        nixLogDir = nixDir + "/my_log";
    }

    // Options documented in `nix help-stores`
    return Store::open(
        "local",
        {
            {"store", nixStoreDir},
            {"state", nixStateDir},
            {"log", nixLogDir},
        });
}

} // namespace nixbind
