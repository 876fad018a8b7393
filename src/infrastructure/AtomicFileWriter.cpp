/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace vaultbreakdown::infrastructure {

namespace fs = std::filesystem;

domain::Status AtomicFileWriter::Write(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[AtomicFileWriter] Error creating directories: " << ec.message() << std::endl;
            return domain::Status::Fail(domain::ErrorKind::Persistence,
                                        "cannot create " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[AtomicFileWriter] Failed to open temp file: " << tempPath << std::endl;
            return domain::Status::Fail(domain::ErrorKind::Persistence, "cannot open " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[AtomicFileWriter] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return domain::Status::Fail(domain::ErrorKind::Persistence, "write failed for " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return domain::Status::Fail(domain::ErrorKind::Persistence,
                                    "rename to " + finalPath.string() + " failed: " + ec.message());
    }
    return domain::Status::Ok();
}

} // namespace vaultbreakdown::infrastructure
