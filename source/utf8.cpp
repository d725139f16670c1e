// utf8.cpp - UTF-8 codec and ICU case folding

#include <docdiff/utf8.h>

#include <unicode/uchar.h>

namespace docdiff {

namespace {

constexpr char32_t kRawByteBase = 0xDC00;

bool is_raw_byte(char32_t cp) noexcept
{
    return cp >= kRawByteBase + 0x80 && cp <= kRawByteBase + 0xFF;
}

} // anonymous namespace

std::u32string decode_utf8(std::string_view s)
{
    std::u32string out;
    out.reserve(s.size());

    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;

        if (c < 0x80) {
            len = 1;
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
            min_cp = 0x10000;
        }

        bool valid = len > 0 && i + len <= s.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cc & 0x3F);
            }
        }
        // Overlong forms, surrogates and values past U+10FFFF are not UTF-8
        if (valid && (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)) {
            valid = false;
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(kRawByteBase + c);
            ++i;
        }
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp)
{
    if (is_raw_byte(cp)) {
        out += static_cast<char>(cp - kRawByteBase);
    } else if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

char32_t fold_code_point(char32_t cp) noexcept
{
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp - 'A' + 'a' : cp;
    }
    if (is_raw_byte(cp)) {
        return cp;
    }
    return static_cast<char32_t>(u_foldCase(static_cast<UChar32>(cp), U_FOLD_CASE_DEFAULT));
}

} // namespace docdiff
