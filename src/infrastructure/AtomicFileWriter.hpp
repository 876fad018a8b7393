/**
 * @file AtomicFileWriter.hpp
 * @brief Crash-safe file writes (temp file + rename).
 */

#pragma once
#include <string>
#include "domain/Result.hpp"

namespace vaultbreakdown::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a file so that readers only ever see the old or the new content.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes content to filename via <filename>.<timestamp>.tmp and rename.
     * Parent directories are created when missing.
     * @return Persistence error on any failure; the temp file is removed.
     */
    static domain::Status Write(const std::string& filename, const std::string& content);
};

} // namespace vaultbreakdown::infrastructure
