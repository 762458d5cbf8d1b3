#include "io/file_io.hpp"

#include "core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>

namespace hcodec {

namespace {

std::string cause() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("stream failure");
}

void write_raw(const std::string& path, const char* data, size_t n) {
    errno = 0;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw PersistenceIOError("Cannot write file: " + path + " (" + cause() + ")");
    ofs.write(data, static_cast<std::streamsize>(n));
    ofs.flush();
    if (!ofs.good()) throw PersistenceIOError("Write failed: " + path + " (" + cause() + ")");
}

} // namespace

std::vector<uint8_t> read_all(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw PersistenceIOError("Cannot open file: " + path + " (" + std::strerror(EISDIR) + ")");
    }
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw PersistenceIOError("Cannot open file: " + path + " (" + cause() + ")");
    // libstdc++ reports a failing read(2) (e.g. EIO) by throwing from underflow
    try {
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure&) {
        throw PersistenceIOError("Read failed: " + path + " (" + cause() + ")");
    }
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    write_raw(path, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string read_text(const std::string& path) {
    std::vector<uint8_t> bytes = read_all(path);
    return std::string(bytes.begin(), bytes.end());
}

void write_text(const std::string& path, const std::string& text) {
    write_raw(path, text.data(), text.size());
}

} // namespace hcodec
