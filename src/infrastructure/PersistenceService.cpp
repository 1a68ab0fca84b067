/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace typolab::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);
    performAtomicWrite(filename, content);
}

std::string PersistenceService::loadText(const std::string& filename) const {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void PersistenceService::performAtomicWrite(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        throw std::runtime_error("Cannot create directory for " + filename + ": " + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            throw std::runtime_error("Cannot open temporary file for " + filename);
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed for " + filename);
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error("Cannot replace " + filename + ": " + e.what());
    }
}

} // namespace typolab::infrastructure
