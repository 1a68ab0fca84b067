/**
 * @file TaxonomyFileStore.cpp
 * @brief Implementation of TaxonomyFileStore.
 */

#include "infrastructure/TaxonomyFileStore.hpp"

#include <filesystem>
#include <iostream>

#include "infrastructure/TaxonomyJsonCodec.hpp"

namespace typolab::infrastructure {

TaxonomyFileStore::TaxonomyFileStore(std::shared_ptr<PersistenceService> persistence)
    : m_persistence(std::move(persistence)) {}

void TaxonomyFileStore::Save(const std::string& path, const TaxonomySnapshot& snapshot) {
    m_persistence->saveText(path, TaxonomyJsonCodec::EncodeSnapshot(snapshot).dump(2));
    std::clog << "[TaxonomyFileStore] Saved " << snapshot.entries.size() << " classes to " << path << std::endl;
}

TaxonomySnapshot TaxonomyFileStore::Load(const std::string& path) const {
    std::string text;
    try {
        text = m_persistence->loadText(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "[TaxonomyFileStore] " << e.what() << std::endl;
        throw MalformedImport("cannot read " + path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedImport("invalid JSON in " + path + ": " + e.what());
    }
    return TaxonomyJsonCodec::DecodeSnapshot(document);
}

TaxonomySnapshot TaxonomyFileStore::LoadOrEmpty(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return TaxonomySnapshot{};
    }
    return Load(path);
}

} // namespace typolab::infrastructure
