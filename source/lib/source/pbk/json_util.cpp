#include <pbk/json_util.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

static auto SplitPath(std::string_view path)
{
    static constexpr auto c_ToStringViews{ std::views::transform(
        [](auto str)
        { return std::string_view(str.data(), str.size()); }) };
    return path | std::views::split('.') | c_ToStringViews;
}

template<class JsonT>
static JsonT* FindJsonValue(JsonT& root, std::string_view path)
{
    JsonT* target_json{ &root };
    for (const auto path_part : SplitPath(path))
    {
        const std::string key{ path_part };
        if (!target_json->is_object() || !target_json->contains(key))
        {
            return nullptr;
        }
        target_json = &(*target_json)[key];
    }
    return target_json;
}

const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path)
{
    const nlohmann::json* target_json{ FindJsonValue(root, path) };
    if (target_json == nullptr)
    {
        throw std::logic_error{
            fmt::format("Path {} is not part of json object", path)
        };
    }
    return *target_json;
}
nlohmann::json& GetJsonValue(nlohmann::json& root,
                             std::string_view path)
{
    nlohmann::json* target_json{ FindJsonValue(root, path) };
    if (target_json == nullptr)
    {
        throw std::logic_error{
            fmt::format("Path {} is not part of json object", path)
        };
    }
    return *target_json;
}

bool HasJsonValue(const nlohmann::json& root,
                  std::string_view path)
{
    return FindJsonValue(root, path) != nullptr;
}

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value)
{
    std::reference_wrapper target_json{ root };
    for (const auto path_part : SplitPath(path))
    {
        if (target_json.get().type() != nlohmann::json::value_t::object)
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        const std::string key{ path_part };
        if (!target_json.get().contains(key))
        {
            target_json.get()[key] = nlohmann::json::object();
        }

        target_json = target_json.get()[key];
    }

    target_json.get() = std::move(value);
    return target_json.get();
}
