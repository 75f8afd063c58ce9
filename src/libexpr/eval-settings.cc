#include "nixbind/expr/eval-settings.hh"
#include "nixbind/util/config-global.hh"

namespace nixbind {

EvalSettings evalSettings;

static GlobalConfig::Register rEvalSettings(&evalSettings);

} // namespace nixbind
