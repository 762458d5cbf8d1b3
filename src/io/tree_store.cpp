#include "io/tree_store.hpp"

#include "format/tree_format.hpp"
#include "io/file_io.hpp"

namespace hcodec {

void save_tree(const std::string& path, const HuffTree& tree) {
    write_all(path, serialize_tree(tree));
}

HuffTree load_tree(const std::string& path) {
    return deserialize_tree(read_all(path));
}

} // namespace hcodec
