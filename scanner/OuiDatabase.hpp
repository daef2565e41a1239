#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>
#include "VendorLookup.hpp"

namespace arp_presence::scanner
{
    // Offline OUI -> vendor table kept in SQLite.
    class OuiDatabase : public VendorLookup
    {
    public:
        OuiDatabase();
        ~OuiDatabase();

        OuiDatabase(const OuiDatabase &) = delete;
        OuiDatabase &operator=(const OuiDatabase &) = delete;

        bool Open(const std::string &db_path);
        void Close();
        bool IsOpen() const;

        bool Insert(const std::string &prefix, const std::string &vendor);

        // Loads an IEEE MA-L CSV ("Registry,Assignment,Organization Name,...").
        // Returns the number of rows stored, or -1 if the file cannot be read.
        int ImportCsv(const std::string &csv_path);

        size_t Count();

        std::optional<std::string> Lookup(const std::string &mac) override;

    private:
        sqlite3 *m_db;
        sqlite3_stmt *m_stmt_lookup;
        mutable std::mutex m_mutex;
    };
}
