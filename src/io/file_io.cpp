#include "io/file_io.hpp"

#include "io/errors.hpp"

#include <fstream>

namespace hufz {

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw IoError("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    std::streamsize n = ifs.tellg();
    if (n < 0) throw IoError("Cannot size file: " + path);
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw IoError("Short read: " + path);
    return buf;
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw IoError("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw IoError("Write failed: " + path);
}

uint64_t count_bytes_in_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs.good()) throw IoError("Cannot open file: " + path);
    std::streamoff n = ifs.tellg();
    if (n < 0) throw IoError("Cannot size file: " + path);
    return static_cast<uint64_t>(n);
}

} // namespace hufz
