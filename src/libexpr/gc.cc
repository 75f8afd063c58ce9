#include "nixbind/expr/gc.hh"
#include "nixbind/expr/init.hh"
#include "nixbind/util/logging.hh"

#include "gc-private.hh"

#include "nix_api_expr.h"

namespace nixbind {

bool isThreadRegistered()
{
    ensureInitialized();
    return GC_thread_is_registered() != 0;
}

ThreadRegistration::ThreadRegistration()
{
    ensureInitialized();

    if (GC_thread_is_registered())
        return;

    GC_stack_base sb;
    if (auto res = GC_get_stack_base(&sb); res != GC_SUCCESS)
        throw RegistrationError("GC_get_stack_base failed: %d", res);

    switch (auto res = GC_register_my_thread(&sb)) {
    case GC_SUCCESS:
        registeredHere = true;
        debug("registered thread with the garbage collector");
        break;
    case GC_DUPLICATE:
        break;
    default:
        throw RegistrationError("GC_register_my_thread failed: %d", res);
    }
}

ThreadRegistration::~ThreadRegistration()
{
    if (!registeredHere)
        return;
    if (auto res = GC_unregister_my_thread(); res != GC_SUCCESS)
        printError("GC_unregister_my_thread failed: %d", res);
    else
        debug("unregistered thread from the garbage collector");
}

void runCollectionNow()
{
    ensureInitialized();
    nix_gc_now();
}

} // namespace nixbind
