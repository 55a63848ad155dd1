#include "common/json_format.hpp"

#include <fmt/format.h>

#include <cstddef>

namespace {

// sv[i] 에서 시작하는 올바른 UTF-8 다중 바이트 시퀀스의 길이. 잘못됐으면 0.
// (overlong, 서로게이트, U+10FFFF 초과는 잘못된 것으로 본다)
std::size_t utf8_sequence_length(std::string_view sv, std::size_t i) {
    const auto byte = [&](std::size_t k) { return static_cast<unsigned char>(sv[k]); };
    const unsigned char lead = byte(i);

    std::size_t   length = 0;
    unsigned char lo     = 0x80;
    unsigned char hi     = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)      { length = 2; }
    else if (lead == 0xE0)                 { length = 3; lo = 0xA0; }
    else if (lead >= 0xE1 && lead <= 0xEC) { length = 3; }
    else if (lead == 0xED)                 { length = 3; hi = 0x9F; }
    else if (lead >= 0xEE && lead <= 0xEF) { length = 3; }
    else if (lead == 0xF0)                 { length = 4; lo = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) { length = 4; }
    else if (lead == 0xF4)                 { length = 4; hi = 0x8F; }
    else { return 0; }

    if (sv.size() - i < length) {
        return 0;
    }
    if (byte(i + 1) < lo || byte(i + 1) > hi) {
        return 0;
    }
    for (std::size_t k = 2; k < length; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (std::size_t i = 0; i < sv.size(); ++i) {
        const char c = sv[i];
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default: {
                const auto uc = static_cast<unsigned char>(c);
                if (uc < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(uc));
                } else if (uc < 0x80) {
                    out += c;
                } else if (const std::size_t n = utf8_sequence_length(sv, i); n > 0) {
                    out.append(sv.substr(i, n));
                    i += n - 1;
                } else {
                    out += "\\ufffd";   // 잘못된 바이트 하나당 하나
                }
                break;
            }
        }
    }
    return out;
}

std::string json_quote(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 2);
    out += '"';
    out += json_escape(sv);
    out += '"';
    return out;
}

std::string json_string_array(const std::vector<std::string>& values) {
    std::string out{"["};
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += json_quote(values[i]);
    }
    out += ']';
    return out;
}

std::string json_number_or_na(const std::optional<double>& value) {
    if (!value) {
        return R"("N/A")";
    }
    // 초 단위 평균: 마이크로초 이하 값도 보이도록 유효숫자 기준 출력
    return fmt::format("{:.9g}", *value);
}
