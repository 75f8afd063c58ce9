#pragma once
///@file

#include "nixbind/util/configuration.hh"

namespace nixbind {

struct EvalSettings : Config
{
    Setting<Strings> lookupPath{
        this,
        {},
        "lookup-path",
        R"(
          List of search paths used to resolve `<...>` lookup paths in
          evaluator states created without an explicit lookup path.
          Entries have the form `prefix=path` or just `path`, as in `NIX_PATH`.
        )",
        {"nix-path"}};
};

extern EvalSettings evalSettings;

} // namespace nixbind
