/*
 * codegate - Configuration
 *
 * JSON configuration file with dotted-key lookup:
 *
 *   {"sandbox": {"timeout": 5}}   ->   cfg.get_int("sandbox.timeout", 5)
 *
 * Missing keys and keys of the wrong type return the supplied default.
 */
#ifndef codegate_CORE_CONFIG_HPP
#define codegate_CORE_CONFIG_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace codegate {

class Config {
public:
    Config();

    // Load from a JSON file. On failure the previous contents are kept
    // and error() describes the problem.
    bool load_file(const std::string& path);

    // Load from a JSON document held in memory
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    double get_double(const std::string& key, double default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    // Array of strings; non-string elements are skipped
    std::vector<std::string> get_string_array(const std::string& key,
                                              const std::vector<std::string>& default_value) const;

    const Json& data() const { return data_; }
    const std::string& error() const { return error_; }

private:
    const Json* lookup(const std::string& key) const;

    Json data_;
    std::string error_;
};

// Export KEY=VALUE lines of a dotenv file into the process environment.
// Variables that are already set are left alone. Lines may carry an
// "export " prefix; values may be single or double quoted; '#' starts a
// comment line. Returns the number of variables exported, or -1 if the
// file cannot be opened.
int load_dotenv(const std::string& path);

} // namespace codegate

#endif // codegate_CORE_CONFIG_HPP
