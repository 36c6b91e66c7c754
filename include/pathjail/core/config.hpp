/*
 * pathjail C++17 - Configuration
 *
 * JSON configuration with dotted-key access ("sandbox.max_segments").
 * Missing or mistyped keys fall back to the supplied default.
 */
#ifndef pathjail_CORE_CONFIG_HPP
#define pathjail_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace pathjail {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load a JSON file. On failure, error describes the problem and the
    // current contents are left untouched.
    bool load_file(const std::string& path, std::string& error);
    bool load_string(const std::string& text, std::string& error);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& data() const { return data_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json data_;
};

} // namespace pathjail

#endif // pathjail_CORE_CONFIG_HPP
