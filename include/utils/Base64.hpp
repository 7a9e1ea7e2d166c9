#pragma once

#include <string>
#include <optional>

namespace sessions::utils {

/**
 * @brief Base64 без зависимостей
 *
 * Декодеры строгие: посторонний символ, невозможная длина или ненулевые
 * хвостовые биты дают std::nullopt. Иначе изменённый последний символ
 * токена мог бы декодироваться в те же байты.
 */
namespace detail {

inline int decodeChar(unsigned char c, bool urlSafe) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (urlSafe) {
        if (c == '-') return 62;
        if (c == '_') return 63;
    } else {
        if (c == '+') return 62;
        if (c == '/') return 63;
    }
    return -1;
}

inline std::string encode(const std::string& input, const char* chars, bool pad) {
    std::string result;
    result.reserve((input.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (unsigned char c : input) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            result.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(chars[(val << -valb) & 0x3F]);
    }
    if (pad) {
        while (result.size() % 4 != 0) {
            result.push_back('=');
        }
    }
    return result;
}

inline std::optional<std::string> decode(const std::string& input, bool urlSafe) {
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(input.size() * 3 / 4);
    int val = 0, valb = -8;
    for (unsigned char c : input) {
        int digit = decodeChar(c, urlSafe);
        if (digit < 0) {
            return std::nullopt;
        }
        val = ((val << 6) + digit) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    // Оставшиеся (valb + 8) бит должны быть нулевыми
    int leftover = valb + 8;
    if (leftover > 0 && (val & ((1 << leftover) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

} // namespace detail

/**
 * @brief base64url без '=' (RFC 4648 §5)
 */
inline std::string base64UrlEncode(const std::string& input) {
    return detail::encode(input,
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_", false);
}

inline std::optional<std::string> base64UrlDecode(const std::string& input) {
    return detail::decode(input, true);
}

/**
 * @brief Стандартный base64 с '='
 */
inline std::string base64Encode(const std::string& input) {
    return detail::encode(input,
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/", true);
}

inline std::optional<std::string> base64Decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string body = input;
    std::size_t padding = 0;
    while (!body.empty() && body.back() == '=' && padding < 2) {
        body.pop_back();
        ++padding;
    }
    return detail::decode(body, false);
}

} // namespace sessions::utils
