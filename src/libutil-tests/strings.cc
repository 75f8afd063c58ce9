#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "nixbind/util/strings.hh"
#include "nixbind/util/tests/utf8.hh"

#include <cstdint>
#include <vector>

namespace nixbind {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, emptyStrings)
{
    Strings strings;
    strings.push_back("");
    strings.push_back("");

    ASSERT_EQ(concatStringsSep(",", strings), ",");
}

TEST(concatStringsSep, buildCommaSeparatedString)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep(",", strings), "this,is,great");
}

TEST(concatStringsSep, buildStringWithEmptySeparator)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep("", strings), "thisisgreat");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString(""), expected);
}

TEST(tokenizeString, oneSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString(" "), expected);
}

TEST(tokenizeString, twoSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString(" \n"), expected);
}

TEST(tokenizeString, tokenizeSpacesWithDefaults)
{
    auto s = "foo bar baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString(s), expected);
}

TEST(tokenizeString, tokenizeTabsNewlinesWithDefaults)
{
    auto s = "foo\tbar\nbaz\r\n";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString(s), expected);
}

TEST(tokenizeString, tokenizeWithCustomSep)
{
    auto s = "foo\n,bar\n,baz\n";
    Strings expected = {"foo\n", "bar\n", "baz\n"};

    ASSERT_EQ(tokenizeString(s, ","), expected);
}

/* ----------------------------------------------------------------------------
 * hasPrefix, toLower
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, works)
{
    ASSERT_TRUE(hasPrefix("extra-foo", "extra-"));
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_FALSE(hasPrefix("ext", "extra-"));
    ASSERT_FALSE(hasPrefix("foo", "bar"));
}

TEST(encodeUTF8, lengthBoundaries)
{
    ASSERT_EQ(encodeUTF8(0x7f), "\x7f");
    ASSERT_EQ(encodeUTF8(0xe9), "\xc3\xa9");
    ASSERT_EQ(encodeUTF8(0x7ff), "\xdf\xbf");
    ASSERT_EQ(encodeUTF8(0x800), "\xe0\xa0\x80");
    ASSERT_EQ(encodeUTF8(0xffff), "\xef\xbf\xbf");
    ASSERT_EQ(encodeUTF8(0x1f600), "\xf0\x9f\x98\x80");
}

TEST(toLower, asciiOnly)
{
    ASSERT_EQ(toLower("AttrSet"), "attrset");
    ASSERT_EQ(toLower("ÜBER"), "Über");
}

/* ----------------------------------------------------------------------------
 * findInvalidUTF8
 * --------------------------------------------------------------------------*/

TEST(findInvalidUTF8, acceptsValid)
{
    ASSERT_EQ(findInvalidUTF8(""), std::nullopt);
    ASSERT_EQ(findInvalidUTF8("hello"), std::nullopt);
    ASSERT_EQ(findInvalidUTF8("ü"), std::nullopt);
    ASSERT_EQ(findInvalidUTF8("日本語"), std::nullopt);
    ASSERT_EQ(findInvalidUTF8("\xf0\x9f\x98\x80"), std::nullopt);
    ASSERT_EQ(findInvalidUTF8(std::string_view("a\0b", 3)), std::nullopt);
}

TEST(findInvalidUTF8, truncatedSequence)
{
    // The first byte of "ü".
    ASSERT_EQ(findInvalidUTF8("\xc3"), 0u);
    ASSERT_EQ(findInvalidUTF8("ab\xe6\x97"), 2u);
}

TEST(findInvalidUTF8, strayContinuationByte)
{
    ASSERT_EQ(findInvalidUTF8("a\x80"), 1u);
}

TEST(findInvalidUTF8, invalidStartByte)
{
    ASSERT_EQ(findInvalidUTF8("\xff"), 0u);
    ASSERT_EQ(findInvalidUTF8("\xf8\x88\x80\x80\x80"), 0u);
}

TEST(findInvalidUTF8, overlongEncoding)
{
    ASSERT_EQ(findInvalidUTF8("\xc0\xaf"), 0u);
    ASSERT_EQ(findInvalidUTF8("\xe0\x80\xaf"), 0u);
}

TEST(findInvalidUTF8, surrogates)
{
    ASSERT_EQ(findInvalidUTF8("x\xed\xa0\x80"), 1u);
}

TEST(findInvalidUTF8, beyondUnicode)
{
    ASSERT_EQ(findInvalidUTF8("\xf4\x90\x80\x80"), 0u);
}

RC_GTEST_PROP(findInvalidUTF8, acceptsEncodedScalarValues, (const std::vector<uint32_t> & raw))
{
    RC_ASSERT(!findInvalidUTF8(encodeScalarValues(raw)));
}

RC_GTEST_PROP(findInvalidUTF8, rejectsTruncatedMultiByteSequence, (const std::string & prefix, uint32_t n))
{
    auto encoded = encodeScalarValues({n}, 0x80);
    /* Only keep prefixes that are themselves valid. */
    std::string valid;
    for (char ch : prefix)
        valid += static_cast<char>(ch & 0x7f);
    auto s = valid + encoded.substr(0, encoded.size() - 1);
    RC_ASSERT(findInvalidUTF8(s) == valid.size());
}

} // namespace nixbind
