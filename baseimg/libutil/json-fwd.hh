#pragma once
///@file JSON support (forward declarations only).

#include <nlohmann/json_fwd.hpp>

namespace baseimg {

using JSON = nlohmann::json;

}
