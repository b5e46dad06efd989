#pragma once

/**
 * Catalog Database
 *
 * SQLite storage of a catalog in a reduced CSS3.0 layout: event, origin,
 * arrival and assoc tables. Every store replaces the previous contents so
 * the database always mirrors one consistent catalog view.
 */

#include "seisstream/catalog/catalog.hpp"
#include <mutex>
#include <string>
#include <vector>

// Forward declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace seisstream {

struct StoredOrigin {
    int64_t evid = 0;
    std::string evname;
    double time = 0;         // Epoch seconds
    double lat = 0;
    double lon = 0;
    double depth = 0;
    int64_t nass = 0;
    double sdobs = 0;        // RMS residual
    double confidence = 0;
    bool finalized = false;
};

struct StoredArrival {
    int64_t arid = 0;
    std::string sta;
    std::string chan;
    double time = 0;
    std::string iphase;
    double probability = 0;
    std::string backend;
    bool superseded = false;
    std::string evname;      // Empty when unassociated
};

/**
 * CatalogDatabase - SQLite catalog persistence
 */
class CatalogDatabase {
public:
    CatalogDatabase();
    ~CatalogDatabase();

    // Prevent copying
    CatalogDatabase(const CatalogDatabase&) = delete;
    CatalogDatabase& operator=(const CatalogDatabase&) = delete;

    // Connection management
    bool open(const std::string& filename);
    bool isOpen() const { return db_ != nullptr; }
    void close();

    bool createSchema();

    void setAuthor(const std::string& auth) { author_ = auth; }
    const std::string& author() const { return author_; }

    // Replace the stored rows with the catalog's export view
    bool storeCatalog(const Catalog& catalog, const std::string& vmodel = "-");

    // Query methods
    std::vector<StoredOrigin> queryOrigins(double starttime, double endtime) const;
    std::vector<StoredArrival> queryArrivals() const;

    // Statistics
    int64_t countEvents() const;
    int64_t countOrigins() const;
    int64_t countArrivals() const;
    int64_t countAssociations() const;

    // Last error message
    std::string lastError() const { return last_error_; }

private:
    sqlite3* db_;
    std::string author_;
    mutable std::string last_error_;
    mutable std::mutex mutex_;

    bool executeSQL(const char* sql);
    void setError(const std::string& context) const;
    int64_t count(const char* table) const;
    double currentLddate() const;
    int64_t epochToJdate(double epoch) const;
};

} // namespace seisstream
