#pragma once

#include <stdexcept>
#include <string>

namespace hufz {

// Source/sink could not be opened, or failed mid-read/write.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Input is not a hufz stream (bad header, truncated payload).
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace hufz
