/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_COMMON_FILE_HPP
#define COBALT_COMMON_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "bytes.hpp"

namespace cobalt::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    using path_list = std::vector<std::filesystem::path>;
    extern path_list files_with_ext(const std::string_view &dir, const std::string_view &ext);
}

#endif // !COBALT_COMMON_FILE_HPP
