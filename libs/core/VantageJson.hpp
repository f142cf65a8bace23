#pragma once
#include <nlohmann/json.hpp>

namespace vantage {

// Producer payloads keep their key order; "first entry" fallbacks follow the producer
using Json = nlohmann::ordered_json;

} // namespace vantage
