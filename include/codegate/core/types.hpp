#ifndef codegate_CORE_TYPES_HPP
#define codegate_CORE_TYPES_HPP

#include <nlohmann/json.hpp>

namespace codegate {

typedef nlohmann::json Json;

} // namespace codegate

#endif // codegate_CORE_TYPES_HPP
