#include "nixbind/util/strings.hh"

#include <algorithm>
#include <cstdint>

namespace nixbind {

Strings tokenizeString(std::string_view s, std::string_view separators)
{
    Strings tokens;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        tokens.emplace_back(s.substr(start, end - start));
        start = s.find_first_not_of(separators, end);
    }
    return tokens;
}

std::string concatStringsSep(std::string_view sep, const Strings & ss)
{
    std::string res;
    for (auto i = ss.begin(); i != ss.end(); ++i) {
        if (i != ss.begin())
            res += sep;
        res += *i;
    }
    return res;
}

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

std::string toLower(std::string s)
{
    for (auto & c : s)
        if (c >= 'A' && c <= 'Z')
            c += 'a' - 'A';
    return s;
}

/**
 * Length of the sequence introduced by `lead`, or 0 if `lead` cannot
 * start one.
 */
static size_t sequenceLength(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if (lead >= 0xc2 && lead <= 0xdf)
        return 2;
    if (lead >= 0xe0 && lead <= 0xef)
        return 3;
    if (lead >= 0xf0 && lead <= 0xf4)
        return 4;
    return 0;
}

std::optional<size_t> findInvalidUTF8(std::string_view s)
{
    static const uint32_t smallest[] = {0, 0, 0x80, 0x800, 0x10000};

    for (size_t pos = 0; pos < s.size();) {
        auto lead = static_cast<unsigned char>(s[pos]);
        auto len = sequenceLength(lead);
        if (len == 0 || s.size() - pos < len)
            return pos;

        uint32_t cp = len == 1 ? lead : lead & (0x7f >> len);
        for (size_t k = 1; k < len; ++k) {
            auto cont = static_cast<unsigned char>(s[pos + k]);
            if ((cont & 0xc0) != 0x80)
                return pos;
            cp = (cp << 6) | (cont & 0x3f);
        }

        if (cp < smallest[len] || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
            return pos;

        pos += len;
    }
    return std::nullopt;
}

} // namespace nixbind
