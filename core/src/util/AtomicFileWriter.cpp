#include "pairkit/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace pairkit::core::util {

namespace {

bool Report(std::string* error, const std::string& message) {
    std::cerr << "[atomic] " << message << '\n';
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path target(path);
    std::error_code ec;
    if (!target.parent_path().empty()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return Report(error, "Failed to create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Report(error, "Failed to open temp file: " + temp.string());
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            return Report(error, "Failed to write temp file: " + temp.string());
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        return Report(error, "rename failed for " + path + ": " + ec.message());
    }
    return true;
}

}  // namespace pairkit::core::util
