#include "nixbind/expr/init.hh"
#include "nixbind/util/engine-settings.hh"
#include "nixbind/util/error-channel.hh"
#include "nixbind/util/init-once.hh"

#include "gc-private.hh"

#include "nix_api_expr.h"

namespace nixbind {

void ensureInitialized()
{
    static InitOnce init("nix_libexpr_init", []() {
        ensureLibUtilInitialized();
        GC_allow_register_threads();
        ErrorChannel channel;
        nix_libexpr_init(channel.ptr());
        channel.check();
    });
    init.ensure();
}

} // namespace nixbind
