#pragma once
///@file JSON support, on top of nlohmann_json.

#include <nlohmann/json.hpp>

namespace baseimg {

using JSON = nlohmann::json;

}
