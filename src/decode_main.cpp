#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "io/file_io.hpp"
#include "io/tree_store.hpp"

#include <iostream>
#include <optional>

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        const std::string tree_path = cli.get("tree");
        if (!cli.positional().empty() || in.empty() || out.empty()) {
            std::cerr << "Usage: hcodec_decode --in <input.bits> --tree <tree.huft> --out <output.txt> [--verbose]\n";
            return 1;
        }

        std::string bits = hcodec::read_text(in);
        // tolerate a trailing newline from editors
        while (!bits.empty() && (bits.back() == '\n' || bits.back() == '\r' ||
                                 bits.back() == ' ' || bits.back() == '\t')) {
            bits.pop_back();
        }

        std::optional<hcodec::HuffTree> tree;
        if (!bits.empty()) {
            if (tree_path.empty()) {
                std::cerr << "Usage: hcodec_decode --in <input.bits> --tree <tree.huft> --out <output.txt> [--verbose]\n";
                return 1;
            }
            tree = hcodec::load_tree(tree_path);
            if (cli.flag("verbose")) {
                std::cerr << "tree: " << tree->leaf_count() << " symbols, "
                          << tree->total_frequency() << " total frequency\n";
            }
        }

        const std::string text = hcodec::huff_decode_text(bits, tree);
        hcodec::write_text(out, text);
        std::cout << "Wrote: " << out << " (" << text.size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
