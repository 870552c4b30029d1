/**
 * @file json.cpp
 * @brief Реализация минималистичного разбора JSON
 */

#include "json.hpp"

#include <cctype>
#include <charconv>

namespace ore::json {

namespace {

constexpr std::size_t npos = std::string_view::npos;

std::size_t skip_ws(std::string_view text, std::size_t pos) noexcept {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

/**
 * @brief Конец строкового литерала, начинающегося с кавычки в pos
 *
 * @return Позиция после закрывающей кавычки или npos
 */
std::size_t skip_string(std::string_view text, std::size_t pos) noexcept {
    ++pos;
    while (pos < text.size()) {
        if (text[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (text[pos] == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return npos;
}

/**
 * @brief Конец значения, начинающегося в pos
 */
std::size_t skip_value(std::string_view text, std::size_t pos) noexcept {
    if (pos >= text.size()) return npos;

    char c = text[pos];
    if (c == '"') {
        return skip_string(text, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < text.size()) {
            char cur = text[pos];
            if (cur == '"') {
                pos = skip_string(text, pos);
                if (pos == npos) return npos;
                continue;
            }
            if (cur == '{' || cur == '[') {
                ++depth;
            } else if (cur == '}' || cur == ']') {
                if (--depth == 0) return pos + 1;
            }
            ++pos;
        }
        return npos;
    }

    // Число, bool или null
    auto end = text.find_first_of(",}] \t\r\n", pos);
    if (end == pos) return npos;
    return end == npos ? text.size() : end;
}

std::string trim(std::string_view text) {
    auto begin = skip_ws(text, 0);
    auto end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

} // anonymous namespace

std::optional<std::string> get_raw(std::string_view object, std::string_view key) {
    std::size_t pos = skip_ws(object, 0);
    if (pos >= object.size() || object[pos] != '{') {
        return std::nullopt;
    }
    ++pos;

    while (true) {
        pos = skip_ws(object, pos);
        if (pos >= object.size() || object[pos] == '}') {
            return std::nullopt;
        }
        if (object[pos] != '"') {
            return std::nullopt;
        }

        auto key_end = skip_string(object, pos);
        if (key_end == npos) return std::nullopt;
        auto current_key = object.substr(pos + 1, key_end - pos - 2);

        pos = skip_ws(object, key_end);
        if (pos >= object.size() || object[pos] != ':') {
            return std::nullopt;
        }
        pos = skip_ws(object, pos + 1);

        auto value_end = skip_value(object, pos);
        if (value_end == npos) return std::nullopt;

        if (current_key == key) {
            return std::string(object.substr(pos, value_end - pos));
        }

        pos = skip_ws(object, value_end);
        if (pos < object.size() && object[pos] == ',') {
            ++pos;
        } else if (pos >= object.size() || object[pos] != '}') {
            return std::nullopt;
        }
    }
}

std::optional<std::string> unquote(std::string_view raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
        return std::nullopt;
    }

    std::string result;
    result.reserve(raw.size() - 2);
    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            result.push_back(c);
            continue;
        }
        if (++i + 1 > raw.size() - 1) return std::nullopt;
        switch (raw[i]) {
            case '"':  result.push_back('"'); break;
            case '\\': result.push_back('\\'); break;
            case '/':  result.push_back('/'); break;
            case 'b':  result.push_back('\b'); break;
            case 'f':  result.push_back('\f'); break;
            case 'n':  result.push_back('\n'); break;
            case 'r':  result.push_back('\r'); break;
            case 't':  result.push_back('\t'); break;
            case 'u': {
                // Только ASCII диапазон, остальное заменяется на '?'
                if (i + 4 >= raw.size() - 1) return std::nullopt;
                unsigned code = 0;
                auto hex = raw.substr(i + 1, 4);
                auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                if (ec != std::errc{} || ptr != hex.data() + hex.size()) return std::nullopt;
                result.push_back(code < 0x80 ? static_cast<char>(code) : '?');
                i += 4;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return result;
}

std::optional<std::string> get_string(std::string_view object, std::string_view key) {
    auto raw = get_raw(object, key);
    if (!raw) return std::nullopt;
    return unquote(*raw);
}

std::optional<int64_t> get_int(std::string_view object, std::string_view key) {
    auto raw = get_raw(object, key);
    if (!raw) return std::nullopt;

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> get_uint(std::string_view object, std::string_view key) {
    auto raw = get_raw(object, key);
    if (!raw) return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> get_bool(std::string_view object, std::string_view key) {
    auto raw = get_raw(object, key);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

bool is_null(std::string_view raw) noexcept {
    auto begin = skip_ws(raw, 0);
    return raw.substr(begin, 4) == "null";
}

std::optional<std::vector<std::string>> split_array(std::string_view raw) {
    std::size_t pos = skip_ws(raw, 0);
    if (pos >= raw.size() || raw[pos] != '[') {
        return std::nullopt;
    }
    ++pos;

    std::vector<std::string> items;
    while (true) {
        pos = skip_ws(raw, pos);
        if (pos >= raw.size()) return std::nullopt;
        if (raw[pos] == ']') return items;

        auto end = skip_value(raw, pos);
        if (end == npos) return std::nullopt;
        items.push_back(trim(raw.substr(pos, end - pos)));

        pos = skip_ws(raw, end);
        if (pos < raw.size() && raw[pos] == ',') {
            ++pos;
        } else if (pos >= raw.size() || raw[pos] != ']') {
            return std::nullopt;
        }
    }
}

std::string escape(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result.push_back(c); break;
        }
    }
    return result;
}

} // namespace ore::json
