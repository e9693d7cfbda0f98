#pragma once

#include <string>

namespace dexcup::core::util {

class AtomicFileWriter {
public:
    // Writes to "<path>.tmp" and renames over |path|; parent directories are created as needed.
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace dexcup::core::util
