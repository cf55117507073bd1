#pragma once

#include <fstream>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace ddc::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path);

    /**
     * @brief Loads a text file split into lines. Blank lines and lines starting with `#` are skipped.
     */
    std::optional<std::vector<std::string>> loadLines(std::filesystem::path path);
}
