#pragma once

#include <string>

namespace pairkit::core::util {

// Writes through a sibling temp file and renames it over the target, so a
// reader sees either the old file or the new one.
class AtomicFileWriter {
public:
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace pairkit::core::util
