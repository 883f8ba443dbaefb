/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <fstream>
#include "file.hpp"

namespace cobalt::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        is.seekg(0, std::ios::end);
        const auto sz = is.tellg();
        if (sz < 0)
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        is.seekg(0, std::ios::beg);
        buf.resize(static_cast<size_t>(sz));
        if (!buf.empty() && !is.read(reinterpret_cast<char *>(buf.data()), sz))
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }

    void write(const std::string &path, const buffer &buf)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(buf.data()), buf.size()))
            throw error_sys(fmt::format("failed to write {} bytes to {}", buf.size(), path));
    }

    path_list files_with_ext(const std::string_view &dir, const std::string_view &ext)
    {
        path_list paths {};
        for (auto &entry: std::filesystem::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                paths.emplace_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }
}
