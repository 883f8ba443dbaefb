/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/fixture.hpp>
#include <cobalt/cli.hpp>
#include <cobalt/common/file.hpp>

namespace cobalt::cli::fixture_check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "fixture-check";
            cmd.desc = "run the decoder against JSON fixture files or directories of them and report mismatches";
            cmd.args.expect({ "<fixture-path>", "[<fixture-path> ...]" });
            cmd.opts.try_emplace("max-depth", "the maximum nesting depth of lists, maps and tags", std::optional<std::string> {}, validate_positive_uint);
        }

        void run(const arguments &args, const options &opts) const override
        {
            cbor::decode_options dec_opts {};
            if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
                dec_opts.max_depth = std::stoull(*it->second);
            size_t num_cases = 0;
            size_t num_failed = 0;
            std::vector<std::string> paths {};
            for (const auto &arg: args) {
                if (std::filesystem::is_directory(arg)) {
                    for (const auto &p: file::files_with_ext(arg, ".json"))
                        paths.emplace_back(p.string());
                } else {
                    paths.emplace_back(arg);
                }
            }
            for (const auto &path: paths) {
                const auto cases = cbor::fixture::load_any(path);
                _check_all(path, cases.success, dec_opts, num_cases, num_failed);
                _check_all(path, cases.errors, dec_opts, num_cases, num_failed);
            }
            logger::info("checked {} fixture cases from {} files: {} failed", num_cases, paths.size(), num_failed);
            if (num_failed)
                throw error(fmt::format("{} out of {} fixture cases failed", num_failed, num_cases));
        }
    private:
        template<typename T>
        static void _check_all(const std::string &path, const T &cases, const cbor::decode_options &opts, size_t &num_cases, size_t &num_failed)
        {
            for (const auto &c: cases) {
                ++num_cases;
                if (const auto err = cbor::fixture::check(c, opts); err) {
                    ++num_failed;
                    logger::error("{}: {}: {}", path, c.description, *err);
                }
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
