/**
 * @file DocumentFileStore.hpp
 * @brief Reads documents and writes them back atomically, keeping a backup of the original.
 */

#pragma once
#include <optional>
#include <string>

namespace structaudit::infrastructure {

/**
 * @class DocumentFileStore
 * @brief Synchronous file I/O for the command-line driver.
 *
 * Writes go to a temp file next to the target and are renamed over it, so a reader never
 * sees a half-written document.
 */
class DocumentFileStore {
public:
    /** @brief Whole file as bytes, or nullopt when it cannot be read. */
    static std::optional<std::string> readText(const std::string& path);

    /**
     * @brief Performs the atomic write (temp -> rename).
     * @return false on failure, after logging the cause.
     */
    static bool writeAtomic(const std::string& path, const std::string& content);

    /** @brief "dir/name_BACKUP.ext" for "dir/name.ext". */
    static std::string backupPath(const std::string& path);

    /** @brief Copies the current file to backupPath(path). */
    static bool backup(const std::string& path);
};

} // namespace structaudit::infrastructure
