#pragma once

#include <pbk/util.hpp>

struct ImageInfo
{
    // File name, unique within a book
    fs::path m_Name;
    fs::path m_Path;
    PixelSize m_PixelSize;
    fs::file_time_type m_LastWriteTime;
};
