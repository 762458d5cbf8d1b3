#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hcodec {

// Whole-file helpers. Failures raise PersistenceIOError with path and cause.
std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

std::string read_text(const std::string& path);
void write_text(const std::string& path, const std::string& text);

} // namespace hcodec
