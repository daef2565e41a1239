#include "OuiDatabase.hpp"
#include "../common/MacAddress.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <vector>

namespace arp_presence::scanner
{
    namespace
    {
        std::vector<std::string> SplitCsvLine(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (quoted)
                {
                    if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        current += '"';
                        ++i;
                    }
                    else if (c == '"')
                        quoted = false;
                    else
                        current += c;
                }
                else if (c == '"')
                    quoted = true;
                else if (c == ',')
                {
                    fields.push_back(current);
                    current.clear();
                }
                else if (c != '\r')
                    current += c;
            }
            fields.push_back(current);
            return fields;
        }

        std::string TrimSpaces(const std::string &text)
        {
            auto first = text.find_first_not_of(" \t");
            if (first == std::string::npos)
                return "";
            auto last = text.find_last_not_of(" \t");
            return text.substr(first, last - first + 1);
        }
    }

    OuiDatabase::OuiDatabase() : m_db(nullptr), m_stmt_lookup(nullptr) {}

    OuiDatabase::~OuiDatabase()
    {
        Close();
    }

    bool OuiDatabase::Open(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db)
            return true;

        if (sqlite3_open(db_path.c_str(), &m_db) != SQLITE_OK)
        {
            std::cerr << "[OuiDatabase] Open failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS oui ("
            "prefix TEXT PRIMARY KEY, "
            "vendor TEXT NOT NULL"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[OuiDatabase] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        const char *sql_lookup = "SELECT vendor FROM oui WHERE prefix = ?;";
        if (sqlite3_prepare_v2(m_db, sql_lookup, -1, &m_stmt_lookup, nullptr) != SQLITE_OK)
        {
            std::cerr << "[OuiDatabase] Prepare failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return true;
    }

    void OuiDatabase::Close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stmt_lookup)
        {
            sqlite3_finalize(m_stmt_lookup);
            m_stmt_lookup = nullptr;
        }
        if (m_db)
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool OuiDatabase::IsOpen() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    bool OuiDatabase::Insert(const std::string &prefix, const std::string &vendor)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db)
            return false;

        std::string key = prefix;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        if (key.size() != 6 || !std::all_of(key.begin(), key.end(), [](unsigned char c)
                                            { return std::isxdigit(c); }))
            return false;
        if (vendor.empty())
            return false;

        const char *sql = "INSERT OR REPLACE INTO oui (prefix, vendor) VALUES (?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, vendor.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    int OuiDatabase::ImportCsv(const std::string &csv_path)
    {
        std::ifstream file(csv_path);
        if (!file.is_open())
        {
            std::cerr << "[OuiDatabase] Cannot open " << csv_path << "\n";
            return -1;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_db)
                return -1;
            // Take the write lock up front so a busy file fails here, not row by row.
            if (sqlite3_exec(m_db, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                std::cerr << "[OuiDatabase] Begin failed: " << sqlite3_errmsg(m_db) << std::endl;
                return -1;
            }
        }

        std::string line;
        std::getline(file, line);

        int loaded = 0;
        while (std::getline(file, line))
        {
            auto fields = SplitCsvLine(line);
            if (fields.size() < 3)
                continue;

            if (Insert(TrimSpaces(fields[1]), TrimSpaces(fields[2])))
                ++loaded;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                std::cerr << "[OuiDatabase] Commit failed: " << sqlite3_errmsg(m_db) << std::endl;
                sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
                return -1;
            }
        }

        std::cout << "[OuiDatabase] Loaded " << loaded << " vendor entries from " << csv_path << "\n";
        return loaded;
    }

    size_t OuiDatabase::Count()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM oui;", -1, &stmt, nullptr) != SQLITE_OK)
            return 0;

        size_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return count;
    }

    std::optional<std::string> OuiDatabase::Lookup(const std::string &mac)
    {
        auto prefix = common::OuiPrefix(mac);
        if (!prefix.has_value())
            return std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db || !m_stmt_lookup)
            return std::nullopt;

        sqlite3_reset(m_stmt_lookup);
        sqlite3_clear_bindings(m_stmt_lookup);
        sqlite3_bind_text(m_stmt_lookup, 1, prefix->c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::string> vendor = std::nullopt;
        if (sqlite3_step(m_stmt_lookup) == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(m_stmt_lookup, 0);
            if (text && text[0] != '\0')
                vendor = std::string(reinterpret_cast<const char *>(text));
        }
        sqlite3_reset(m_stmt_lookup);
        return vendor;
    }
}
