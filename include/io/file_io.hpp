#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hufz {

std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

// Size of a file in bytes; throws IoError if it cannot be opened.
uint64_t count_bytes_in_file(const std::string& path);

} // namespace hufz
