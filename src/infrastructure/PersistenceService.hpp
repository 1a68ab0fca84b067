/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <mutex>
#include <string>

namespace typolab::infrastructure {

/**
 * @class PersistenceService
 * @brief Performs atomic file writes one at a time.
 *
 * Writes go to a temporary sibling file which is then renamed over the
 * target, so readers never observe a half-written taxonomy.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Atomically replaces the file content.
     * @param filename Path of the file to write.
     * @param content The string content to write.
     * @throws std::runtime_error when the file cannot be written.
     */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @throws std::runtime_error when the file cannot be opened.
     */
    std::string loadText(const std::string& filename) const;

private:
    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    void performAtomicWrite(const std::string& filename, const std::string& content);

    std::mutex m_mutex;
};

} // namespace typolab::infrastructure
