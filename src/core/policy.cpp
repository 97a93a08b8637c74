#include <codegate/core/policy.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/logger.hpp>

#include <vector>

namespace codegate {

namespace {

std::set<std::string> default_denied_modules() {
    std::set<std::string> denied;
    denied.insert("os");
    denied.insert("sys");
    denied.insert("subprocess");
    return denied;
}

} // namespace

Policy::Policy()
    : denied_modules_(default_denied_modules())
    , allowed_functions_()
    , timeout_ms_(DEFAULT_TIMEOUT_MS)
{}

Policy::Policy(const std::set<std::string>& denied_modules,
               int timeout_ms,
               const std::set<std::string>& allowed_functions)
    : denied_modules_(denied_modules)
    , allowed_functions_(allowed_functions)
    , timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_TIMEOUT_MS)
{}

Policy Policy::from_config(const Config& cfg) {
    std::set<std::string> denied = default_denied_modules();
    if (cfg.has("sandbox.denied_modules")) {
        std::vector<std::string> names = cfg.get_string_array("sandbox.denied_modules",
                                                              std::vector<std::string>());
        denied = std::set<std::string>(names.begin(), names.end());
    }

    std::vector<std::string> allowed = cfg.get_string_array("sandbox.allowed_functions",
                                                            std::vector<std::string>());

    double timeout_secs = cfg.get_double("sandbox.timeout", DEFAULT_TIMEOUT_MS / 1000.0);
    double millis = timeout_secs * 1000.0;
    int timeout_ms;
    if (!(millis >= 1.0)) {
        LOG_WARN("[Policy] sandbox.timeout must be positive, using %d ms", DEFAULT_TIMEOUT_MS);
        timeout_ms = DEFAULT_TIMEOUT_MS;
    } else if (millis > static_cast<double>(MAX_TIMEOUT_MS)) {
        LOG_WARN("[Policy] sandbox.timeout too large, using %d ms", MAX_TIMEOUT_MS);
        timeout_ms = MAX_TIMEOUT_MS;
    } else {
        timeout_ms = static_cast<int>(millis);
    }

    return Policy(denied, timeout_ms, std::set<std::string>(allowed.begin(), allowed.end()));
}

bool Policy::is_denied(const std::string& module) const {
    if (module.empty()) {
        return false;
    }
    std::string top = module.substr(0, module.find('.'));
    return denied_modules_.count(top) > 0;
}

} // namespace codegate
