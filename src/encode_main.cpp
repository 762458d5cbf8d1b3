#include "cli/cli_parser.hpp"
#include "codec/encoder.hpp"
#include "entropy/code_table.hpp"
#include "io/file_io.hpp"
#include "io/tree_store.hpp"
#include "metrics/ratio.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static void dump_code_table(const hcodec::HuffTree& tree) {
    hcodec::CodeTable table = hcodec::build_code_table(tree);
    std::vector<std::pair<hcodec::Symbol, std::string>> rows(table.begin(), table.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second.size() != b.second.size()) return a.second.size() < b.second.size();
        return a.first < b.first;
    });
    for (const auto& [sym, code] : rows) {
        std::fprintf(stderr, "sym=%u len=%zu code=%s\n", sym, code.size(), code.c_str());
    }
}

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        const std::string tree_path = cli.get("tree");
        if (!cli.positional().empty() || in.empty() || out.empty() || tree_path.empty()) {
            std::cout << "Usage: hcodec_encode --in <input.txt> --out <output.bits> --tree <tree.huft> [--verbose]\n";
            return 1;
        }

        const std::string text = hcodec::read_text(in);
        hcodec::EncodeResult encoded = hcodec::huff_encode_text(text);
        hcodec::write_text(out, encoded.bits);

        if (encoded.tree) {
            hcodec::save_tree(tree_path, *encoded.tree);
            if (cli.flag("verbose")) dump_code_table(*encoded.tree);
        } else {
            std::cout << "Empty input: no tree written\n";
        }

        const double ratio = hcodec::compression_ratio(text.size(), encoded.bits.size());
        std::cout << "input size: " << text.size() << " symbols\n";
        std::cout << "encoded size: " << encoded.bits.size() << " digits\n";
        std::printf("compression ratio: %.2f%%\n", ratio);
        std::cout << "Wrote: " << out << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
