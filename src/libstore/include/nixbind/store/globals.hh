#pragma once
///@file

#include "nixbind/util/configuration.hh"

namespace nixbind {

struct StoreSettings : public Config
{
    Setting<std::string> storeUri{
        this,
        "auto",
        "store",
        R"(
          The URI of the store opened by `Store::openDefault()`, e.g.
          `auto`, `daemon`, `local?root=/tmp/root` or `dummy://`.
        )"};
};

extern StoreSettings storeSettings;

} // namespace nixbind
