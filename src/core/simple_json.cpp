#include "c19/simple_json.hpp"
#include <charconv>
#include <cstdio>
#include <stdexcept>

namespace c19 {

namespace {

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t skip_ws(std::string_view s, size_t pos) {
    while (pos < s.size() && is_ws(s[pos])) ++pos;
    return pos;
}

// s[pos] must be the opening quote; returns the position past the closing one
size_t skip_string(std::string_view s, size_t pos) {
    ++pos;
    while (pos < s.size()) {
        char c = s[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == '"') return pos + 1;
        ++pos;
    }
    throw std::runtime_error("Unterminated JSON string");
}

size_t skip_value(std::string_view s, size_t pos) {
    if (pos >= s.size()) {
        throw std::runtime_error("Unexpected end of JSON");
    }

    char c = s[pos];
    if (c == '"') {
        return skip_string(s, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char ch = s[pos];
            if (ch == '"') {
                pos = skip_string(s, pos);
                continue;
            }
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                if (--depth == 0) return pos + 1;
            }
            ++pos;
        }
        throw std::runtime_error("Unterminated JSON container");
    }

    // Number or literal
    size_t end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' &&
           s[end] != ']' && !is_ws(s[end])) {
        ++end;
    }
    if (end == pos) {
        throw std::runtime_error("Expected JSON value");
    }
    return end;
}

uint32_t parse_hex4(std::string_view s, size_t pos) {
    if (pos + 4 > s.size()) {
        throw std::runtime_error("Truncated unicode escape");
    }
    uint32_t cp = 0;
    auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + 4, cp, 16);
    if (ec != std::errc() || ptr != s.data() + pos + 4) {
        throw std::runtime_error("Invalid unicode escape");
    }
    return cp;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace

SimpleJson::SimpleJson(std::string_view json) {
    size_t pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '{') {
        throw std::runtime_error("Expected JSON object");
    }

    pos = skip_ws(json, pos + 1);
    if (pos < json.size() && json[pos] == '}') {
        ++pos;
    } else {
        while (true) {
            if (pos >= json.size() || json[pos] != '"') {
                throw std::runtime_error("Expected JSON member name");
            }
            size_t key_end = skip_string(json, pos);
            std::string key = unquote(json.substr(pos, key_end - pos));

            pos = skip_ws(json, key_end);
            if (pos >= json.size() || json[pos] != ':') {
                throw std::runtime_error("Expected ':' after \"" + key + "\"");
            }

            pos = skip_ws(json, pos + 1);
            size_t value_end = skip_value(json, pos);
            members_.emplace_back(std::move(key),
                                  std::string(json.substr(pos, value_end - pos)));

            pos = skip_ws(json, value_end);
            if (pos >= json.size()) {
                throw std::runtime_error("Unterminated JSON object");
            }
            if (json[pos] == ',') {
                pos = skip_ws(json, pos + 1);
                continue;
            }
            if (json[pos] == '}') {
                ++pos;
                break;
            }
            throw std::runtime_error("Expected ',' or '}' in JSON object");
        }
    }

    if (skip_ws(json, pos) != json.size()) {
        throw std::runtime_error("Trailing characters after JSON object");
    }
}

const std::string* SimpleJson::find(const std::string& key) const {
    // Last occurrence wins, as with most JSON readers
    for (auto it = members_.rbegin(); it != members_.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

bool SimpleJson::has(const std::string& key) const {
    return find(key) != nullptr;
}

bool SimpleJson::is_null(const std::string& key) const {
    auto* raw = find(key);
    return raw && *raw == "null";
}

bool SimpleJson::is_string(const std::string& key) const {
    auto* raw = find(key);
    return raw && !raw->empty() && raw->front() == '"';
}

std::string SimpleJson::get_string(const std::string& key, const std::string& def) const {
    auto* raw = find(key);
    if (!raw || *raw == "null") return def;
    if (raw->empty() || raw->front() != '"') {
        throw std::runtime_error("Expected string for \"" + key + "\"");
    }
    return unquote(*raw);
}

int64_t SimpleJson::get_int(const std::string& key, int64_t def) const {
    auto value = get_optional_int(key);
    return value ? *value : def;
}

std::optional<int64_t> SimpleJson::get_optional_int(const std::string& key) const {
    auto* raw = find(key);
    if (!raw || *raw == "null") return std::nullopt;

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size()) {
        throw std::runtime_error("Expected integer for \"" + key + "\"");
    }
    return value;
}

bool SimpleJson::get_bool(const std::string& key, bool def) const {
    auto* raw = find(key);
    if (!raw || *raw == "null") return def;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    throw std::runtime_error("Expected boolean for \"" + key + "\"");
}

std::vector<std::string> SimpleJson::get_string_array(const std::string& key) const {
    std::vector<std::string> result;
    auto* raw = find(key);
    if (!raw || *raw == "null") return result;

    std::string_view arr = *raw;
    if (arr.empty() || arr.front() != '[') {
        throw std::runtime_error("Expected array for \"" + key + "\"");
    }

    size_t pos = skip_ws(arr, 1);
    if (pos < arr.size() && arr[pos] == ']') return result;

    while (pos < arr.size()) {
        if (arr[pos] != '"') {
            throw std::runtime_error("Expected string elements in \"" + key + "\"");
        }
        size_t end = skip_string(arr, pos);
        result.push_back(unquote(arr.substr(pos, end - pos)));

        pos = skip_ws(arr, end);
        if (pos < arr.size() && arr[pos] == ',') {
            pos = skip_ws(arr, pos + 1);
        } else if (pos < arr.size() && arr[pos] == ']') {
            return result;
        } else {
            break;
        }
    }
    throw std::runtime_error("Malformed array for \"" + key + "\"");
}

SimpleJson SimpleJson::get_object(const std::string& key) const {
    auto* raw = find(key);
    if (!raw || *raw == "null") return SimpleJson();
    return SimpleJson(*raw);
}

std::string SimpleJson::get_raw(const std::string& key) const {
    auto* raw = find(key);
    return raw ? *raw : std::string();
}

std::vector<std::string> SimpleJson::keys() const {
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& [key, value] : members_) {
        result.push_back(key);
    }
    return result;
}

std::string SimpleJson::quote(std::string_view str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

std::string SimpleJson::unquote(std::string_view literal) {
    if (literal.size() < 2 || literal.front() != '"' || literal.back() != '"') {
        throw std::runtime_error("Expected JSON string literal");
    }

    std::string out;
    out.reserve(literal.size() - 2);
    size_t end = literal.size() - 1;

    for (size_t i = 1; i < end; ++i) {
        char c = literal[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }

        if (++i >= end) {
            throw std::runtime_error("Truncated escape sequence");
        }
        switch (literal[i]) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                uint32_t cp = parse_hex4(literal.substr(0, end), i + 1);
                i += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < end &&
                    literal[i + 1] == '\\' && literal[i + 2] == 'u') {
                    uint32_t low = parse_hex4(literal.substr(0, end), i + 3);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default:
                throw std::runtime_error("Invalid escape sequence");
        }
    }
    return out;
}

}  // namespace c19
