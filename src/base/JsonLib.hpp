#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for frame payloads and domain
 * records.
 */
using json = nlohmann::json;
