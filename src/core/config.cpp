#include <memguard/core/config.hpp>
#include <memguard/core/logger.hpp>
#include <memguard/core/utils.hpp>
#include <fstream>
#include <cstdlib>

namespace memguard {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        LOG_ERROR("Config: cannot open %s", path.c_str());
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    if (!load_string(content)) {
        LOG_ERROR("Config: %s is not valid JSON", path.c_str());
        return false;
    }
    LOG_DEBUG("Config: loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_WARN("Config: top-level value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const JsonError& e) {
        LOG_WARN("Config: parse error: %s", e.what());
        return false;
    }
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "MEMGUARD_" + to_upper(key);
    for (size_t i = 0; i < env.size(); ++i) {
        if (env[i] == '.' || env[i] == '-') env[i] = '_';
    }
    return env;
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v) return false;
    out = v;
    return true;
}

const Json& Config::lookup(const std::string& key) const {
    static Json null_json;
    
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object() || !node->has(parts[i])) {
            LOG_DEBUG("Config: key '%s' not found", key.c_str());
            return null_json;
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    std::string env;
    return env_value(key, env) || !lookup(key).is_null();
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("Config: '%s' from environment", key.c_str());
        return env;
    }
    
    const Json& v = lookup(key);
    return v.is_string() ? v.as_string() : def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    std::string env;
    if (env_value(key, env)) {
        char* end = 0;
        long long n = std::strtoll(env.c_str(), &end, 10);
        if (end != env.c_str() && *end == '\0') {
            return n;
        }
        LOG_WARN("Config: ignoring non-numeric %s", to_env_key(key).c_str());
    }
    
    const Json& v = lookup(key);
    return v.is_number() ? v.as_int() : def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    std::string env;
    if (env_value(key, env)) {
        std::string s = to_lower(trim(env));
        if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
        if (s == "0" || s == "false" || s == "no" || s == "off") return false;
        LOG_WARN("Config: ignoring non-boolean %s", to_env_key(key).c_str());
    }
    
    const Json& v = lookup(key);
    return v.is_bool() ? v.as_bool() : def;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

void Config::apply_log_level() const {
    std::string name = get_string("log_level");
    if (name.empty()) return;
    
    LogLevel level;
    if (parse_log_level(name, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Config: unknown log_level '%s'", name.c_str());
    }
}

const Json& Config::data() const { return data_; }

} // namespace memguard
