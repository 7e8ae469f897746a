#include <charconv>
#include <cmath>
#include <sklib/debug.hh>
#include <sklib/json_str/json_str.hh>

namespace json_str {

namespace {

// Returns the length of the well-formed UTF-8 sequence starting at @p pos, or
// 0 if there is none (overlong forms, surrogates and code points above
// U+10FFFF are ill-formed)
size_t utf8_sequence_length(std::string_view str, size_t pos) noexcept {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(str[i]); };
    auto is_continuation = [&](size_t i) { return i < str.size() and (byte(i) & 0xc0) == 0x80; };

    unsigned char lead = byte(pos);
    size_t len;
    unsigned char second_min = 0x80;
    unsigned char second_max = 0xbf;
    if (lead >= 0xc2 and lead <= 0xdf) {
        len = 2;
    } else if (lead >= 0xe0 and lead <= 0xef) {
        len = 3;
        if (lead == 0xe0) {
            second_min = 0xa0;
        } else if (lead == 0xed) {
            second_max = 0x9f;
        }
    } else if (lead >= 0xf0 and lead <= 0xf4) {
        len = 4;
        if (lead == 0xf0) {
            second_min = 0x90;
        } else if (lead == 0xf4) {
            second_max = 0x8f;
        }
    } else {
        return 0;
    }

    if (pos + 1 >= str.size() or byte(pos + 1) < second_min or byte(pos + 1) > second_max) {
        return 0;
    }
    for (size_t i = pos + 2; i < pos + len; ++i) {
        if (not is_continuation(i)) {
            return 0;
        }
    }
    return len;
}

} // namespace

void append_stringified_json(std::string& dest, std::string_view str) {
    static constexpr char hex_digits[] = "0123456789abcdef";
    dest.reserve(dest.size() + str.size() + 2);
    dest += '"';
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        switch (c) {
        case '"': dest += "\\\""; break;
        case '\\': dest += "\\\\"; break;
        case '\n': dest += "\\n"; break;
        case '\t': dest += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                dest += "\\u00";
                dest += hex_digits[(c >> 4) & 15];
                dest += hex_digits[c & 15];
            } else if (static_cast<unsigned char>(c) < 0x80) {
                dest += c;
            } else if (size_t len = utf8_sequence_length(str, i); len > 0) {
                dest.append(str, i, len);
                i += len - 1;
            } else {
                dest += "\\ufffd"; // each invalid byte becomes U+FFFD
            }
        }
    }
    dest += '"';
}

void append_json_double(std::string& dest, double val) {
    if (not std::isfinite(val)) {
        dest += "null"; // JSON has no representation for inf and nan
        return;
    }

    char buff[32];
    auto [ptr, ec] = std::to_chars(buff, buff + sizeof(buff), val);
    if (ec != std::errc{}) {
        THROW("std::to_chars() failed");
    }
    dest.append(buff, ptr);
}

} // namespace json_str
