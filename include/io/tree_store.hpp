#pragma once

#include <string>

#include "tree/huffman_tree.hpp"

namespace hcodec {

// Write the serialized tree (.huft) to path. Throws PersistenceIOError.
void save_tree(const std::string& path, const HuffTree& tree);

// Read and validate a .huft file. Throws PersistenceIOError when the file
// cannot be read and MalformedModelError when its content is invalid.
HuffTree load_tree(const std::string& path);

} // namespace hcodec
