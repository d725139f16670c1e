// utf8.h - UTF-8 decoding and Unicode case folding

#pragma once

#include <docdiff/api.h>

#include <string>
#include <string_view>

namespace docdiff {

/// Decode UTF-8 into code points.
/// A byte that does not start a valid sequence decodes to U+DC80..U+DCFF
/// (its value plus 0xDC00), so any byte string survives a decode/encode
/// round trip unchanged.
[[nodiscard]] DOCDIFF_API std::u32string decode_utf8(std::string_view s);

/// Append one code point; U+DC80..U+DCFF are written back as the raw byte
DOCDIFF_API void append_utf8(std::string& out, char32_t cp);

/// Simple (one to one) Unicode case folding of a code point
[[nodiscard]] DOCDIFF_API char32_t fold_code_point(char32_t cp) noexcept;

} // namespace docdiff
