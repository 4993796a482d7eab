#ifndef RANKPOLL_CORE_CONFIG_HPP
#define RANKPOLL_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace rankpoll {

// JSON-backed configuration. Keys use dot notation for nesting
// ("storage.path"). A value missing from the file falls back to the
// environment variable RANKPOLL_<KEY> with dots turned into underscores
// (RANKPOLL_STORAGE_PATH), then to the supplied default.
class Config {
public:
    Config();
    
    // Load from JSON file; false if unreadable or not a JSON object
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    // Last load error, empty after a successful load
    const std::string& last_error() const;

private:
    Json data_;
    std::string last_error_;
    
    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
    static std::string to_env_key(const std::string& key);
};

} // namespace rankpoll

#endif // RANKPOLL_CORE_CONFIG_HPP
