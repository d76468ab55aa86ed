#pragma once
#include "record.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace kankodori {

// The catalog file is missing or unusable. Fatal for a search.
class CatalogUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Immutable view of the catalog as loaded at one point in time.
class Catalog {
public:
    explicit Catalog(std::vector<Record> records);

    const std::vector<Record>& records() const { return records_; }
    size_t size() const { return records_.size(); }

    const Record* find(const std::string& id) const;

    // Records whose location contains any keyword (case-sensitive substring).
    std::vector<Record> by_location_keyword(const std::set<std::string>& keywords) const;

private:
    std::vector<Record> records_;
    std::unordered_map<std::string, size_t> id_index_; // id -> records_ index
};

// Parse a catalog document ({"photo": [...]}). Throws CatalogUnavailable.
std::shared_ptr<const Catalog> parse_catalog(const std::string& json_str,
                                             const std::string& source);

// JSON-backed record repository with a cached snapshot.
// Readers hold a shared_ptr to the snapshot they started with, so
// invalidate() never changes what an in-flight search sees.
class CatalogRepository {
public:
    explicit CatalogRepository(std::string path);

    // Current snapshot, loading it if needed. Throws CatalogUnavailable.
    std::shared_ptr<const Catalog> snapshot();

    std::vector<Record> all_records();
    std::optional<Record> by_id(const std::string& id);
    std::vector<Record> by_location_keyword(const std::set<std::string>& keywords);

    // Drop the cached snapshot; the next read reloads from disk.
    void invalidate();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::shared_ptr<const Catalog> cache_;
};

} // namespace kankodori
