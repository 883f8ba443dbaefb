/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <cobalt/cbor/decoder.hpp>
#include <cobalt/cli.hpp>
#include <cobalt/common/file.hpp>
#include <cobalt/config.hpp>

namespace cobalt::cli::decode {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "decode";
            cmd.desc = "decode a CBOR item from a file and print its structure";
            cmd.args.expect({ "<input>" });
            cmd.opts.try_emplace("hex", "the input is a hex string or a file with one, whitespace is ignored");
            cmd.opts.try_emplace("all", "decode a sequence of CBOR items until the end of the file");
            cmd.opts.try_emplace("max-depth", "the maximum nesting depth of lists, maps and tags", std::optional<std::string> {}, validate_positive_uint);
            cmd.opts.try_emplace("config", "a JSON file with decoder options");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            uint8_vector data {};
            if (opts.contains("hex")) {
                std::string hex = path;
                if (std::filesystem::is_regular_file(path)) {
                    const auto hex_data = file::read(path);
                    hex = hex_data.str();
                }
                std::erase_if(hex, [](const char c) { return std::isspace(static_cast<unsigned char>(c)); });
                data = uint8_vector::from_hex(hex);
            } else {
                data = file::read(path);
            }
            const auto dec_opts = _options(opts);
            logger::info("decoding {} bytes from {} with max depth {}", data.size(), path, dec_opts.max_depth);
            if (opts.contains("all")) {
                const auto items = cbor::decode_all(data, dec_opts);
                for (size_t i = 0; i < items.size(); ++i)
                    fmt::print("#{}: {}\n", i, items[i]);
                logger::info("decoded {} items", items.size());
            } else {
                const auto res = cbor::decode(data, dec_opts);
                fmt::print("{}\n", res.val);
                if (res.size < data.size())
                    logger::warn("{} trailing bytes after the first item have been ignored", data.size() - res.size);
                logger::info("the item consumed {} of {} bytes", res.size, data.size());
            }
        }
    private:
        static cbor::decode_options _options(const options &opts)
        {
            cbor::decode_options dec_opts {};
            if (const auto it = opts.find("config"); it != opts.end()) {
                if (!it->second)
                    throw error("the --config option requires a path");
                dec_opts = cbor::decode_options::from_config(config_file { *it->second });
            }
            if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
                dec_opts.max_depth = std::stoull(*it->second);
            return dec_opts;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
