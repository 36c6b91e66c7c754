/*
 * pathjail C++17 - Configuration Implementation
 */
#include <pathjail/core/config.hpp>
#include <pathjail/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace pathjail {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path, std::string& error) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        error = "cannot open config file: " + path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return load_string(content.str(), error);
}

bool Config::load_string(const std::string& text, std::string& error) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        error = "config is not valid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }
    data_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v || !v->is_number_integer()) return def;
    return v->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace pathjail
