/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cobalt/cbor/fixture.hpp>
#include <cobalt/cli.hpp>

namespace cobalt::cli::fixture_export {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "fixture-export";
            cmd.desc = "write the built-in decoder test fixtures as JSON files into a directory";
            cmd.args.expect({ "<output-dir>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto paths = cbor::fixture::export_catalog(args.at(0));
            for (const auto &p: paths)
                fmt::print("{}\n", p);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
