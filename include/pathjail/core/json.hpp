#ifndef pathjail_CORE_JSON_HPP
#define pathjail_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace pathjail {

typedef nlohmann::json Json;

} // namespace pathjail

#endif // pathjail_CORE_JSON_HPP
