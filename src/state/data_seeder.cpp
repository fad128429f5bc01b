#include "c19/data_seeder.hpp"
#include "c19/simple_json.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace c19 {

DataSeeder::DataSeeder(Reconciler& reconciler, std::optional<uint64_t> default_ttl,
                       ClockFn clock)
    : reconciler_(reconciler)
    , default_ttl_(default_ttl)
    , clock_(std::move(clock))
{}

MergeStats DataSeeder::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open seed file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

MergeStats DataSeeder::load_json(const std::string& json) {
    SimpleJson root(json);
    auto now = clock_();

    EntryList entries;
    entries.reserve(root.size());

    for (const auto& name : root.keys()) {
        if (name.empty() || name.size() > MAX_KEY_SIZE) {
            throw std::runtime_error("Invalid seed key length");
        }

        auto raw = root.get_raw(name);
        if (raw.empty() || raw.front() != '{') {
            throw std::runtime_error("Seed entry \"" + name + "\" must be an object");
        }
        SimpleJson item(raw);

        if (!item.has("value")) {
            throw std::runtime_error("Seed entry \"" + name + "\" has no value");
        }
        std::string value = item.is_string("value") ? item.get_string("value")
                                                    : item.get_raw("value");

        Entry entry = Entry::make(value, now, default_ttl_);
        if (auto ts = item.get_optional_int("ts")) {
            if (*ts < 0) {
                throw std::runtime_error("Seed entry \"" + name + "\" has a negative ts");
            }
            entry.created_at = static_cast<Timestamp>(*ts);
        }
        if (auto ttl = item.get_optional_int("ttl")) {
            if (*ttl <= 0) {
                throw std::runtime_error("Seed entry \"" + name + "\" has a non-positive ttl");
            }
            entry.ttl = static_cast<uint64_t>(*ttl);
        }

        entries.emplace_back(Key(name), std::move(entry));
    }

    return reconciler_.apply(entries);
}

}  // namespace c19
