#include "file.hpp"

#include <sstream>

#include "utils.hpp"

namespace ddc::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path)
    {
        if(std::filesystem::exists(path) == false)
        {
            spdlog::error(std::format("Cannot find {}.", path.string()));
            return std::nullopt;
        }
        
        std::ifstream file(path, std::ios::in);

        if(file.good() == false)
        {  
            spdlog::error(std::format("Failed to open file {}", path.string()));
            return std::nullopt;
        }

        const std::string file_content = std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        file.close();

        return file_content;
    }

    std::optional<std::vector<std::string>> loadLines(std::filesystem::path path)
    {
        const auto content = loadTextFile(std::move(path));
        if(!content)
        {
            return std::nullopt;
        }

        std::vector<std::string> lines;
        std::istringstream stream(*content);
        std::string line;
        while(std::getline(stream, line))
        {
            const std::string_view trimmed = utils::trim(line);
            if(trimmed.empty() || trimmed.starts_with('#'))
            {
                continue;
            }
            lines.emplace_back(trimmed);
        }
        return lines;
    }
}
