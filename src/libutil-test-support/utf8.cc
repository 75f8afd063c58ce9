#include "nixbind/util/tests/utf8.hh"

namespace nixbind {

std::string encodeUTF8(uint32_t cp)
{
    if (cp < 0x80)
        return std::string(1, static_cast<char>(cp));

    /* Continuation bytes, least significant first. */
    std::string tail;
    uint32_t leadLimit = 0x40;
    unsigned char leadMark = 0x80;
    while (cp >= leadLimit) {
        tail += static_cast<char>(0x80 | (cp & 0x3f));
        cp >>= 6;
        leadLimit >>= 1;
        leadMark = 0x80 | (leadMark >> 1);
    }

    std::string res(1, static_cast<char>(leadMark | cp));
    res.append(tail.rbegin(), tail.rend());
    return res;
}

std::string encodeScalarValues(const std::vector<uint32_t> & raw, uint32_t min)
{
    std::string s;
    for (auto n : raw) {
        uint32_t cp = min + n % (0x110000 - min);
        if (cp >= 0xd800 && cp <= 0xdfff)
            cp -= 0x800;
        s += encodeUTF8(cp);
    }
    return s;
}

} // namespace nixbind
