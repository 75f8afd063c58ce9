#include "nixbind/store/globals.hh"
#include "nixbind/util/config-global.hh"

namespace nixbind {

StoreSettings storeSettings;

static GlobalConfig::Register rStoreSettings(&storeSettings);

} // namespace nixbind
