#include <gtest/gtest.h>

#include "nixbind/util/string-callback.hh"

namespace nixbind {

static void reportBytes(const char * bytes, unsigned int n, void (*callback)(const char *, unsigned int, void *), void * data)
{
    callback(bytes, n, data);
}

TEST(receiveString, copiesExactlyNBytes)
{
    std::string out = "previous contents";
    reportBytes("a\0b and more", 3, NIXBIND_RECEIVE_STRING(out));
    ASSERT_EQ(out, std::string("a\0b", 3));
}

TEST(receiveString, emptyString)
{
    std::string out = "previous contents";
    reportBytes("", 0, NIXBIND_RECEIVE_STRING(out));
    ASSERT_EQ(out, "");
}

} // namespace nixbind
