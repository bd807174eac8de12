#pragma once

#include <string>

namespace pricefetcher::utils {

namespace detail {

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/**
 * @brief Percent-decoding сегмента пути или значения query
 *
 * IRequest отдаёт path-параметры и query как есть, без декодирования.
 *
 * @param plusAsSpace true для значений query ('+' -> ' ')
 *
 * Некорректные последовательности (%G1, обрезанный %) остаются как есть.
 */
inline std::string urlDecode(const std::string& value, bool plusAsSpace = false) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int hi = detail::hexValue(value[i + 1]);
            int lo = detail::hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            result.push_back(' ');
            continue;
        }
        result.push_back(c);
    }

    return result;
}

/**
 * @brief Percent-encoding сегмента пути (RFC 3986 unreserved не кодируются)
 */
inline std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;

    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 0x0F]);
        }
    }

    return result;
}

} // namespace pricefetcher::utils
