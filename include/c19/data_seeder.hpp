#pragma once

#include "reconciler.hpp"
#include <filesystem>

namespace c19 {

// Loads initial entries from JSON of the form
//   {"key": {"value": <json>, "ttl": <ms>, "ts": <ms>}, ...}
// String values are stored as their contents, anything else as its JSON
// text. Missing "ts" means now; missing "ttl" means the default ttl.
// Entries are merged like remote ones. Throws std::runtime_error on bad input.
class DataSeeder {
public:
    DataSeeder(Reconciler& reconciler, std::optional<uint64_t> default_ttl,
               ClockFn clock = now_ms);

    MergeStats load_json(const std::string& json);
    MergeStats load_file(const std::filesystem::path& path);

private:
    Reconciler& reconciler_;
    std::optional<uint64_t> default_ttl_;
    ClockFn clock_;
};

}  // namespace c19
