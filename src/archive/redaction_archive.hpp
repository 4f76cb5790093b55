#ifndef CLINSCRUB_ARCHIVE_REDACTION_ARCHIVE_HPP
#define CLINSCRUB_ARCHIVE_REDACTION_ARCHIVE_HPP

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>
#include <zlib.h>
#include "../report/stats_report.hpp"
#include "../scrubber/redaction_stats.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"

namespace clinscrub {
namespace archive {

/*
  RedactionArchive
  --------------------------------
  Keeps scrubbed notes in a SQLite database.

  - Only redacted text is stored, zlib-compressed.
  - Each row is keyed by the SHA-256 fingerprint of the original note, so a
    note can be recognised again without keeping any PHI.
  - The stats JSON report is stored beside the note.

  Every method opens its own connection, so an archive object can be shared
  between threads (SQLite serializes the writers).
*/
class RedactionArchive
{
public:
    explicit RedactionArchive(const std::string &dbFilePath) : m_dbFilePath(dbFilePath) {}

    // -------------------------------------------------------------------------
    // Insert one scrubbed note. Returns true on success; on failure the
    // transaction is rolled back and the error is logged.
    // -------------------------------------------------------------------------
    bool Store(const std::string &originalText, const std::string &redactedText,
               const scrubber::RedactionStats &stats)
    {
        using namespace clinscrub::util::logger;
        Logger &logger = Logger::getInstance();

        std::string fingerprint;
        try {
            fingerprint = util::hashing::sha256Hex(originalText);
        } catch (const std::exception &ex) {
            logger.error(std::string("[RedactionArchive] Fingerprint failed: ") + ex.what());
            return false;
        }

        sqlite3 *db = nullptr;
        if (!openDatabase(db)) {
            logger.error("[RedactionArchive] Could not open database: " + m_dbFilePath);
            return false;
        }

        if (!beginTransaction(db)) {
            logger.error("[RedactionArchive] Could not start transaction.");
            sqlite3_close(db);
            return false;
        }

        if (!insertNote(db, fingerprint, redactedText, report::formatJson(stats))) {
            logger.error(std::string("[RedactionArchive] Insert failed: ") + sqlite3_errmsg(db));
            rollbackTransaction(db);
            sqlite3_close(db);
            return false;
        }

        if (!commitTransaction(db)) {
            logger.error("[RedactionArchive] Failed to commit transaction.");
            rollbackTransaction(db);
            sqlite3_close(db);
            return false;
        }

        logger.debug("[RedactionArchive] Stored note " + fingerprint.substr(0, 12) + " (" +
                     std::to_string(stats.total()) + " redactions)");
        sqlite3_close(db);
        return true;
    }

    // -------------------------------------------------------------------------
    // Number of stored notes: 0 if the archive doesn't exist yet, -1 if it
    // can't be read.
    // -------------------------------------------------------------------------
    int64_t Count() const
    {
        sqlite3 *db = nullptr;
        const int rc = openForRead(db);
        if (rc == SQLITE_CANTOPEN) {
            return 0;
        }
        if (rc != SQLITE_OK) {
            return -1;
        }

        int64_t count = -1;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM redactions;", -1, &stmt, nullptr) ==
                SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return count;
    }

    bool Contains(const std::string &fingerprint) const
    {
        return LoadRedacted(fingerprint).has_value();
    }

    // -------------------------------------------------------------------------
    // Newest redacted text stored under a fingerprint, decompressed.
    // -------------------------------------------------------------------------
    std::optional<std::string> LoadRedacted(const std::string &fingerprint) const
    {
        using namespace clinscrub::util::logger;

        sqlite3 *db = nullptr;
        const int rc = openForRead(db);
        if (rc == SQLITE_CANTOPEN) {
            return std::nullopt;
        }
        if (rc != SQLITE_OK) {
            Logger::getInstance().error("[RedactionArchive] Could not open database: " +
                                        m_dbFilePath);
            return std::nullopt;
        }

        const char *sql = "SELECT note, note_size FROM redactions WHERE fingerprint = ? "
                          "ORDER BY id DESC LIMIT 1;";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            sqlite3_close(db);
            return std::nullopt;
        }
        sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::string> result;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto *blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
            const int blen = sqlite3_column_bytes(stmt, 0);
            const sqlite3_int64 originalSize = sqlite3_column_int64(stmt, 1);
            std::vector<uint8_t> compressed(blob, blob + blen);
            result = decompress(compressed, static_cast<uLongf>(originalSize));
            if (!result) {
                Logger::getInstance().error("[RedactionArchive] Corrupt note for fingerprint " +
                                            fingerprint.substr(0, 12));
            }
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return result;
    }

    const std::string &GetPath() const { return m_dbFilePath; }

private:
    // -------------------------------------------------------------------------
    // Helper: read-only connection for lookups. Never creates the file;
    // SQLITE_CANTOPEN means there is no archive yet.
    // -------------------------------------------------------------------------
    int openForRead(sqlite3 *&db) const
    {
        const int rc = sqlite3_open_v2(m_dbFilePath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK && db) {
            sqlite3_close(db);
            db = nullptr;
        }
        return rc;
    }

    // -------------------------------------------------------------------------
    // Helper: open the database for writing and make sure the schema exists
    // -------------------------------------------------------------------------
    bool openDatabase(sqlite3 *&db) const
    {
        int rc = sqlite3_open(m_dbFilePath.c_str(), &db);
        if (rc != SQLITE_OK || db == nullptr) {
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
            return false;
        }
        if (!initDatabaseSchema(db)) {
            sqlite3_close(db);
            db = nullptr;
            return false;
        }
        return true;
    }

    bool initDatabaseSchema(sqlite3 *db) const
    {
        const char *ddl = "CREATE TABLE IF NOT EXISTS redactions ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " fingerprint TEXT NOT NULL,"
                          " note BLOB,"
                          " note_size INTEGER NOT NULL,"
                          " stats TEXT,"
                          " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                          ");"
                          "CREATE INDEX IF NOT EXISTS idx_redactions_fingerprint"
                          " ON redactions(fingerprint);";

        char *errMsg = nullptr;
        int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            if (errMsg) {
                clinscrub::util::logger::Logger::getInstance().error(
                    "[RedactionArchive] initDatabaseSchema error: " + std::string(errMsg));
                sqlite3_free(errMsg);
            }
            return false;
        }
        return true;
    }

    bool beginTransaction(sqlite3 *db)
    {
        return (sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    bool commitTransaction(sqlite3 *db)
    {
        return (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    bool rollbackTransaction(sqlite3 *db)
    {
        return (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    bool insertNote(sqlite3 *db, const std::string &fingerprint, const std::string &redactedText,
                    const std::string &statsJson)
    {
        const char *sql = "INSERT INTO redactions (fingerprint, note, note_size, stats) "
                          "VALUES (?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK || !stmt) {
            return false;
        }

        std::vector<uint8_t> compressed;
        uLongf outSize = compressBound(redactedText.size());
        compressed.resize(outSize);
        if (compress2(compressed.data(), &outSize,
                      reinterpret_cast<const Bytef*>(redactedText.data()), redactedText.size(),
                      Z_BEST_COMPRESSION) != Z_OK) {
            sqlite3_finalize(stmt);
            return false;
        }
        compressed.resize(outSize);

        if (sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC) != SQLITE_OK ||
            sqlite3_bind_blob(stmt, 2, compressed.data(), static_cast<int>(compressed.size()),
                              SQLITE_STATIC) != SQLITE_OK ||
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(redactedText.size())) !=
                SQLITE_OK ||
            sqlite3_bind_text(stmt, 4, statsJson.c_str(), -1, SQLITE_STATIC) != SQLITE_OK) {
            sqlite3_finalize(stmt);
            return false;
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return (rc == SQLITE_DONE);
    }

    static std::optional<std::string> decompress(const std::vector<uint8_t> &compressed,
                                                 uLongf originalSize)
    {
        std::string out(originalSize, '\0');
        if (originalSize == 0) {
            return out;
        }
        uLongf outSize = originalSize;
        if (uncompress(reinterpret_cast<Bytef*>(&out[0]), &outSize, compressed.data(),
                       compressed.size()) != Z_OK ||
            outSize != originalSize) {
            return std::nullopt;
        }
        return out;
    }

    std::string m_dbFilePath;
};

} // namespace archive
} // namespace clinscrub

#endif // CLINSCRUB_ARCHIVE_REDACTION_ARCHIVE_HPP
