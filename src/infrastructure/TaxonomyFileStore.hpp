/**
 * @file TaxonomyFileStore.hpp
 * @brief Reads and writes taxonomy export documents on disk.
 */

#pragma once

#include <memory>
#include <string>

#include "application/taxonomy/TaxonomyRegistry.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace typolab::infrastructure {

using typolab::application::taxonomy::TaxonomySnapshot;

/**
 * @class TaxonomyFileStore
 * @brief JSON file persistence for TaxonomySnapshot.
 */
class TaxonomyFileStore {
public:
    explicit TaxonomyFileStore(std::shared_ptr<PersistenceService> persistence = std::make_shared<PersistenceService>());

    /**
     * @brief Writes the snapshot atomically (temp file, then rename).
     * @throws std::runtime_error when the file cannot be written.
     */
    void Save(const std::string& path, const TaxonomySnapshot& snapshot);

    /**
     * @brief Reads and decodes a snapshot.
     * @throws MalformedImport when the file is unreadable or invalid.
     */
    TaxonomySnapshot Load(const std::string& path) const;

    /** @brief Load, or an empty snapshot when the file does not exist. */
    TaxonomySnapshot LoadOrEmpty(const std::string& path) const;

private:
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace typolab::infrastructure
