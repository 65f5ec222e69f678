#pragma once

#include <string_view>

std::string_view PictureBookVersion();
std::string_view PictureBookBuildTime();

consteval std::string_view JsonFormatVersion()
{
    return "PBK00001";
}

consteval std::string_view SettingsFormatVersion()
{
    return "PBK00001";
}
