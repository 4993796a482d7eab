/*
 * rankpoll - Configuration Implementation
 *
 * Lookup order: file, then RANKPOLL_* environment variable, then default.
 */
#include <rankpoll/core/config.hpp>
#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace rankpoll {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    Json parsed;
    try {
        parsed = Json::parse(json_str);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "config root must be a JSON object";
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json& Config::lookup(const std::string& key) const {
    // Walk dot-separated segments ("storage.path" -> data_["storage"]["path"])
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }
    
    std::string env;
    if (env_value(key, env)) {
        return env;
    }
    
    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_int();
    }
    
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0' && !env.empty()) {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

const std::string& Config::last_error() const { return last_error_; }

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v) return false;
    out = v;
    return true;
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "RANKPOLL_" + to_upper(key);
    for (size_t i = 0; i < env.size(); ++i) {
        if (env[i] == '.' || env[i] == '-') env[i] = '_';
    }
    return env;
}

} // namespace rankpoll
