#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace c19 {

// Minimal reader for one JSON object level.
//
// The constructor splits the top-level object into members, keeping every
// member value as raw JSON text; nested objects are parsed on demand through
// get_object(). Throws std::runtime_error on malformed input.
class SimpleJson {
public:
    SimpleJson() = default;
    explicit SimpleJson(std::string_view json);

    bool has(const std::string& key) const;
    bool is_null(const std::string& key) const;
    bool is_string(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    std::optional<int64_t> get_optional_int(const std::string& key) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    // Missing members yield an empty object
    SimpleJson get_object(const std::string& key) const;

    // Raw JSON text of a member value, empty if missing
    std::string get_raw(const std::string& key) const;

    std::vector<std::string> keys() const;
    size_t size() const { return members_.size(); }

    // Escapes a string into a JSON string literal (including quotes)
    static std::string quote(std::string_view str);

    // Decodes a JSON string literal (including quotes)
    static std::string unquote(std::string_view literal);

private:
    std::vector<std::pair<std::string, std::string>> members_;

    const std::string* find(const std::string& key) const;
};

}  // namespace c19
