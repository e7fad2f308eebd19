/**
 * @file DocumentFileStore.cpp
 * @brief Implementation of DocumentFileStore.
 */

#include "infrastructure/DocumentFileStore.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace structaudit::infrastructure {

namespace fs = std::filesystem;

std::optional<std::string> DocumentFileStore::readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[DocumentFileStore] Could not open " << path << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        std::cerr << "[DocumentFileStore] Read failed: " << path << std::endl;
        return std::nullopt;
    }
    return buffer.str();
}

bool DocumentFileStore::writeAtomic(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    // Unique temp path: <file>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[DocumentFileStore] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[DocumentFileStore] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[DocumentFileStore] Write failed: " << tempPath << std::endl;
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[DocumentFileStore] Rename failed: " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }
    return true;
}

std::string DocumentFileStore::backupPath(const std::string& path) {
    fs::path original = path;
    fs::path backup = original.parent_path() / (original.stem().string() + "_BACKUP" + original.extension().string());
    return backup.string();
}

bool DocumentFileStore::backup(const std::string& path) {
    std::error_code ec;
    fs::copy_file(path, backupPath(path), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cerr << "[DocumentFileStore] Backup of " << path << " failed: " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[DocumentFileStore] Backup saved to " << backupPath(path) << std::endl;
    return true;
}

} // namespace structaudit::infrastructure
