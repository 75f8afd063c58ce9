#include "nixbind/util/string-callback.hh"

namespace nixbind {

void receiveString(const char * start, unsigned int n, void * user_data)
{
    auto out = static_cast<std::string *>(user_data);
    out->assign(start, n);
}

} // namespace nixbind
