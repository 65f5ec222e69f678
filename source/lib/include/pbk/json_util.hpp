#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

// Paths are dot-separated object keys, e.g. "page.size"
const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path);
nlohmann::json& GetJsonValue(nlohmann::json& root,
                             std::string_view path);

bool HasJsonValue(const nlohmann::json& root,
                  std::string_view path);

// Creates intermediate objects as needed
nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);
