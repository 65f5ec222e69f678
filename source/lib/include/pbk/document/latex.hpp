#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <pbk/util.hpp>

// Escapes _ & % $ # { } ~ ^ and backslashes so that file names can be typeset as text
std::string EscapeLatex(std::string_view text);

/*
        Runs binary on tex_file the given number of times, output is written next to tex_file.
        Returns false if the binary can not be started or any run fails, the output of the
        failing run is logged.
*/
bool CompileLatex(const fs::path& tex_file, const std::string& binary = "pdflatex", uint32_t runs = 2);
