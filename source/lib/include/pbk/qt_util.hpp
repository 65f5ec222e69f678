#pragma once

#include <string>
#include <string_view>

#include <pbk/util.hpp>

class QString;

QString ToQString(const char* c_string);
QString ToQString(const std::string& string);
QString ToQString(const std::string_view string_view);
QString ToQString(const fs::path& path);
