#pragma once

#include <nlohmann/json.hpp>

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

/**
 * @brief JSON object that serializes keys in insertion order, used for
 * messages whose field order is part of the wire format.
 */
using ordered_json = nlohmann::ordered_json;
