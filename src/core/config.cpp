/*
 * codegate - Configuration Implementation
 */
#include <codegate/core/config.hpp>
#include <codegate/core/logger.hpp>
#include <codegate/core/utils.hpp>

#include <fstream>
#include <sstream>
#include <cstdlib>

namespace codegate {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        error_ = "cannot open " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        error_ = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!parsed.is_object()) {
        error_ = "top-level value must be an object";
        return false;
    }

    data_ = parsed;
    error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            return nullptr;
        }
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_string()) return default_value;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number()) return default_value;
    if (v->is_number_float()) {
        return static_cast<int64_t>(v->get<double>());
    }
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number()) return default_value;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_boolean()) return default_value;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_array(const std::string& key,
                                                  const std::vector<std::string>& default_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_array()) return default_value;

    std::vector<std::string> out;
    for (size_t i = 0; i < v->size(); ++i) {
        const Json& item = (*v)[i];
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else {
            LOG_WARN("[Config] Ignoring non-string element %zu of '%s'", i, key.c_str());
        }
    }
    return out;
}

// ============================================================================
// dotenv
// ============================================================================

int load_dotenv(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return -1;
    }

    int exported = 0;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;

        if (starts_with(entry, "export ")) {
            entry = trim(entry.substr(7));
        }

        size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("[Config] %s:%d: expected KEY=VALUE", path.c_str(), line_no);
            continue;
        }

        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value[0] == '"' && value[value.size() - 1] == '"') ||
             (value[0] == '\'' && value[value.size() - 1] == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Existing environment wins
        if (getenv(key.c_str()) != nullptr) continue;

        if (setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++exported;
        }
    }

    LOG_DEBUG("[Config] Exported %d variables from %s", exported, path.c_str());
    return exported;
}

} // namespace codegate
