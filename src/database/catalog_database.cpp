/**
 * Catalog Database Implementation
 *
 * SQLite storage of picks and events using the CSS3.0 event, origin,
 * arrival and assoc tables, extended with detection probability and
 * catalog state columns.
 */

#include "seisstream/database/catalog_database.hpp"
#include <sqlite3.h>
#include <chrono>
#include <ctime>
#include <iostream>

namespace seisstream {

namespace {

const char* CREATE_EVENT_SQL = R"(
    CREATE TABLE IF NOT EXISTS event (
        evid        INTEGER PRIMARY KEY,
        evname      TEXT,
        prefor      INTEGER,
        auth        TEXT DEFAULT '-',
        commid      INTEGER DEFAULT -1,
        lddate      REAL
    )
)";

const char* CREATE_ORIGIN_SQL = R"(
    CREATE TABLE IF NOT EXISTS origin (
        lat         REAL,
        lon         REAL,
        depth       REAL,
        time        REAL,
        orid        INTEGER PRIMARY KEY,
        evid        INTEGER,
        jdate       INTEGER,
        nass        INTEGER DEFAULT -1,
        ndef        INTEGER DEFAULT -1,
        etype       TEXT DEFAULT '-',
        dtype       TEXT DEFAULT '-',
        algorithm   TEXT DEFAULT '-',
        sdobs       REAL DEFAULT -999.0,
        conf        REAL DEFAULT -999.0,
        finalized   INTEGER DEFAULT 0,
        auth        TEXT DEFAULT '-',
        lddate      REAL,
        FOREIGN KEY (evid) REFERENCES event(evid)
    )
)";

const char* CREATE_ARRIVAL_SQL = R"(
    CREATE TABLE IF NOT EXISTS arrival (
        sta         TEXT,
        time        REAL,
        arid        INTEGER PRIMARY KEY,
        jdate       INTEGER,
        chan        TEXT DEFAULT '-',
        iphase      TEXT DEFAULT '-',
        prob        REAL DEFAULT -999.0,
        superseded  INTEGER DEFAULT 0,
        auth        TEXT DEFAULT '-',
        lddate      REAL
    )
)";

const char* CREATE_ASSOC_SQL = R"(
    CREATE TABLE IF NOT EXISTS assoc (
        arid        INTEGER,
        orid        INTEGER,
        sta         TEXT,
        phase       TEXT,
        delta       REAL DEFAULT -999.0,
        timeres     REAL DEFAULT -999.0,
        timedef     TEXT DEFAULT 'd',
        vmodel      TEXT DEFAULT '-',
        lddate      REAL,
        PRIMARY KEY (arid, orid),
        FOREIGN KEY (arid) REFERENCES arrival(arid),
        FOREIGN KEY (orid) REFERENCES origin(orid)
    )
)";

const char* CREATE_INDICES_SQL = R"(
    CREATE INDEX IF NOT EXISTS origin_time ON origin(time);
    CREATE INDEX IF NOT EXISTS arrival_time ON arrival(time);
    CREATE INDEX IF NOT EXISTS assoc_orid ON assoc(orid);
)";

double toEpoch(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count() / 1e6;
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

CatalogDatabase::CatalogDatabase()
    : db_(nullptr)
    , author_("seisstream")
{
}

CatalogDatabase::~CatalogDatabase() {
    close();
}

bool CatalogDatabase::open(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    int rc = sqlite3_open(filename.c_str(), &db_);
    if (rc != SQLITE_OK) {
        setError("Failed to open database");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    executeSQL("PRAGMA foreign_keys = ON;");
    executeSQL("PRAGMA synchronous = NORMAL;");
    return true;
}

void CatalogDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CatalogDatabase::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    if (!executeSQL(CREATE_EVENT_SQL)) return false;
    if (!executeSQL(CREATE_ORIGIN_SQL)) return false;
    if (!executeSQL(CREATE_ARRIVAL_SQL)) return false;
    if (!executeSQL(CREATE_ASSOC_SQL)) return false;
    if (!executeSQL(CREATE_INDICES_SQL)) return false;
    return true;
}

bool CatalogDatabase::storeCatalog(const Catalog& catalog, const std::string& vmodel) {
    std::vector<ExportRecord> rows = catalog.exportView();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    if (!executeSQL("BEGIN TRANSACTION")) return false;

    sqlite3_stmt* ins_event = nullptr;
    sqlite3_stmt* ins_origin = nullptr;
    sqlite3_stmt* ins_arrival = nullptr;
    sqlite3_stmt* ins_assoc = nullptr;

    auto finish = [&](bool ok) {
        sqlite3_finalize(ins_event);
        sqlite3_finalize(ins_origin);
        sqlite3_finalize(ins_arrival);
        sqlite3_finalize(ins_assoc);
        if (ok) {
            ok = executeSQL("COMMIT");
        }
        if (!ok) {
            std::string error = last_error_;
            executeSQL("ROLLBACK");
            last_error_ = error;
        }
        return ok;
    };

    if (!executeSQL("DELETE FROM assoc; DELETE FROM origin; DELETE FROM event; DELETE FROM arrival;")) {
        return finish(false);
    }

    const char* event_sql =
        "INSERT INTO event (evid, evname, prefor, auth, lddate) VALUES (?, ?, ?, ?, ?)";
    const char* origin_sql =
        "INSERT INTO origin (lat, lon, depth, time, orid, evid, jdate, nass, ndef, etype, dtype, "
        "algorithm, sdobs, conf, finalized, auth, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 'eq', ?, ?, ?, ?, ?, ?, ?)";
    const char* arrival_sql =
        "INSERT INTO arrival (sta, time, arid, jdate, chan, iphase, prob, superseded, auth, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    const char* assoc_sql =
        "INSERT INTO assoc (arid, orid, sta, phase, delta, timeres, vmodel, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    if (sqlite3_prepare_v2(db_, event_sql, -1, &ins_event, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, origin_sql, -1, &ins_origin, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, arrival_sql, -1, &ins_arrival, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, assoc_sql, -1, &ins_assoc, nullptr) != SQLITE_OK) {
        setError("Failed to prepare statements");
        return finish(false);
    }

    double lddate = currentLddate();

    // Arrivals first so assoc rows can reference them
    for (const auto& row : rows) {
        if (row.kind != ExportRecord::Kind::Pick) continue;
        const Pick& pick = *row.pick;
        double epoch = toEpoch(pick.time);

        sqlite3_reset(ins_arrival);
        sqlite3_bind_text(ins_arrival, 1, pick.stream_id.station.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_arrival, 2, epoch);
        sqlite3_bind_int64(ins_arrival, 3, static_cast<sqlite3_int64>(pick.id));
        sqlite3_bind_int64(ins_arrival, 4, epochToJdate(epoch));
        sqlite3_bind_text(ins_arrival, 5, pick.stream_id.channel.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins_arrival, 6, phaseTypeToString(pick.phase_type).c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_arrival, 7, pick.probability);
        sqlite3_bind_int(ins_arrival, 8, row.superseded ? 1 : 0);
        sqlite3_bind_text(ins_arrival, 9, pick.backend.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_arrival, 10, lddate);

        if (sqlite3_step(ins_arrival) != SQLITE_DONE) {
            setError("Failed to insert arrival");
            return finish(false);
        }
    }

    int64_t evid = 0;
    for (const auto& row : rows) {
        if (row.kind != ExportRecord::Kind::Event) continue;
        const Event& event = *row.event;
        const Origin& origin = event.origin();
        evid++;
        int64_t orid = evid;
        double epoch = toEpoch(origin.time);

        sqlite3_reset(ins_event);
        sqlite3_bind_int64(ins_event, 1, evid);
        sqlite3_bind_text(ins_event, 2, event.id().c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins_event, 3, orid);
        sqlite3_bind_text(ins_event, 4, author_.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_event, 5, lddate);
        if (sqlite3_step(ins_event) != SQLITE_DONE) {
            setError("Failed to insert event");
            return finish(false);
        }

        sqlite3_reset(ins_origin);
        sqlite3_bind_double(ins_origin, 1, origin.location.latitude);
        sqlite3_bind_double(ins_origin, 2, origin.location.longitude);
        sqlite3_bind_double(ins_origin, 3, origin.location.depth);
        sqlite3_bind_double(ins_origin, 4, epoch);
        sqlite3_bind_int64(ins_origin, 5, orid);
        sqlite3_bind_int64(ins_origin, 6, evid);
        sqlite3_bind_int64(ins_origin, 7, epochToJdate(epoch));
        sqlite3_bind_int64(ins_origin, 8, static_cast<sqlite3_int64>(event.pickIds().size()));
        sqlite3_bind_int64(ins_origin, 9, origin.phase_count);
        sqlite3_bind_text(ins_origin, 10, origin.is_fixed_depth ? "g" : "f", -1, SQLITE_STATIC);
        sqlite3_bind_text(ins_origin, 11, origin.algorithm.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_origin, 12, origin.rms);
        sqlite3_bind_double(ins_origin, 13, event.confidence());
        sqlite3_bind_int(ins_origin, 14, event.isFinalized() ? 1 : 0);
        sqlite3_bind_text(ins_origin, 15, author_.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins_origin, 16, lddate);
        if (sqlite3_step(ins_origin) != SQLITE_DONE) {
            setError("Failed to insert origin");
            return finish(false);
        }

        for (const auto& arr : origin.arrivals) {
            if (!event.references(arr.pick_id)) continue;

            sqlite3_reset(ins_assoc);
            sqlite3_bind_int64(ins_assoc, 1, static_cast<sqlite3_int64>(arr.pick_id));
            sqlite3_bind_int64(ins_assoc, 2, orid);
            sqlite3_bind_text(ins_assoc, 3, arr.station.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(ins_assoc, 4, phaseTypeToString(arr.phase_type).c_str(), -1,
                              SQLITE_TRANSIENT);
            sqlite3_bind_double(ins_assoc, 5, arr.distance / constants::KM_PER_DEG);
            sqlite3_bind_double(ins_assoc, 6, arr.residual);
            sqlite3_bind_text(ins_assoc, 7, vmodel.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(ins_assoc, 8, lddate);
            if (sqlite3_step(ins_assoc) != SQLITE_DONE) {
                setError("Failed to insert assoc");
                return finish(false);
            }
        }
    }

    return finish(true);
}

std::vector<StoredOrigin> CatalogDatabase::queryOrigins(double starttime, double endtime) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredOrigin> results;

    if (!db_) return results;

    const char* sql = R"(
        SELECT e.evid, e.evname, o.time, o.lat, o.lon, o.depth, o.nass, o.sdobs, o.conf, o.finalized
        FROM event e
        JOIN origin o ON e.prefor = o.orid
        WHERE o.time BETWEEN ? AND ?
        ORDER BY o.time, e.evname
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query origins");
        return results;
    }

    sqlite3_bind_double(stmt, 1, starttime);
    sqlite3_bind_double(stmt, 2, endtime);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredOrigin o;
        o.evid = sqlite3_column_int64(stmt, 0);
        o.evname = columnText(stmt, 1);
        o.time = sqlite3_column_double(stmt, 2);
        o.lat = sqlite3_column_double(stmt, 3);
        o.lon = sqlite3_column_double(stmt, 4);
        o.depth = sqlite3_column_double(stmt, 5);
        o.nass = sqlite3_column_int64(stmt, 6);
        o.sdobs = sqlite3_column_double(stmt, 7);
        o.confidence = sqlite3_column_double(stmt, 8);
        o.finalized = sqlite3_column_int(stmt, 9) != 0;
        results.push_back(o);
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<StoredArrival> CatalogDatabase::queryArrivals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredArrival> results;

    if (!db_) return results;

    const char* sql = R"(
        SELECT a.arid, a.sta, a.chan, a.time, a.iphase, a.prob, a.auth, a.superseded, e.evname
        FROM arrival a
        LEFT JOIN assoc s ON a.arid = s.arid
        LEFT JOIN origin o ON s.orid = o.orid
        LEFT JOIN event e ON o.evid = e.evid
        ORDER BY a.time, a.sta, a.arid
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query arrivals");
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredArrival a;
        a.arid = sqlite3_column_int64(stmt, 0);
        a.sta = columnText(stmt, 1);
        a.chan = columnText(stmt, 2);
        a.time = sqlite3_column_double(stmt, 3);
        a.iphase = columnText(stmt, 4);
        a.probability = sqlite3_column_double(stmt, 5);
        a.backend = columnText(stmt, 6);
        a.superseded = sqlite3_column_int(stmt, 7) != 0;
        a.evname = columnText(stmt, 8);
        results.push_back(a);
    }

    sqlite3_finalize(stmt);
    return results;
}

int64_t CatalogDatabase::count(const char* table) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return 0;

    std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
    sqlite3_stmt* stmt;
    int64_t n = 0;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            n = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    return n;
}

int64_t CatalogDatabase::countEvents() const { return count("event"); }
int64_t CatalogDatabase::countOrigins() const { return count("origin"); }
int64_t CatalogDatabase::countArrivals() const { return count("arrival"); }
int64_t CatalogDatabase::countAssociations() const { return count("assoc"); }

double CatalogDatabase::currentLddate() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

int64_t CatalogDatabase::epochToJdate(double epoch) const {
    time_t t = static_cast<time_t>(epoch);
    struct tm tm;
    if (!gmtime_r(&t, &tm)) return 0;

    // Julian date format: YYYYDDD
    return (tm.tm_year + 1900) * 1000 + tm.tm_yday + 1;
}

bool CatalogDatabase::executeSQL(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        if (errmsg) {
            last_error_ = errmsg;
            sqlite3_free(errmsg);
        }
        std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
        return false;
    }
    return true;
}

void CatalogDatabase::setError(const std::string& context) const {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no connection");
    std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
}

} // namespace seisstream
