#ifndef MEMGUARD_CORE_CONFIG_HPP
#define MEMGUARD_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace memguard {

class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    // Dot notation for nested keys ("security.audit_log_path"). An environment
    // variable named after the key (MEMGUARD_SECURITY_AUDIT_LOG_PATH) wins.
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    bool has(const std::string& key) const;
    
    // Get nested object (null when missing)
    const Json& get_section(const std::string& key) const;
    
    // Applies the top-level "log_level" key to the logger, if present
    void apply_log_level() const;
    
    // Raw data access
    const Json& data() const;
    
    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    
    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace memguard

#endif // MEMGUARD_CORE_CONFIG_HPP
