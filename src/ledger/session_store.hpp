#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace uptally {

// Thrown for any failed store operation. readOnly() is set when SQLite
// refused the write because the database or its directory is not writable.
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string &message, bool readOnly)
        : std::runtime_error(message)
        , m_readOnly(readOnly)
    {
    }

    bool readOnly() const
    {
        return m_readOnly;
    }

private:
    bool m_readOnly;
};

// SessionStore is the SQLite access layer for the session ledger.
// One table, keyed by an AUTOINCREMENT sequence so sequences are never
// reused even after rows are removed by hand.
class SessionStore {
public:
    enum class OpenMode {
        ReadWrite,
        ReadOnly
    };

    // ReadWrite creates the parent directory and the schema when missing.
    // ReadOnly requires an existing ledger.
    explicit SessionStore(const std::string &path, OpenMode mode = OpenMode::ReadWrite);
    ~SessionStore();

    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;

    const std::string &path() const;
    bool isReadOnly() const;

    // Appends an open record and returns its assigned sequence.
    int64_t appendOpen(const SessionRecord &record);

    // Rewrites the mutable fields of the record with record.sequence.
    void updateOpen(const SessionRecord &record);

    // Closes the current tail and appends the next open record in one
    // transaction. Either both rows land or neither does.
    int64_t closeAndAppend(const SessionRecord &closed, const SessionRecord &next);

    std::optional<SessionRecord> lastRecord() const;
    std::vector<SessionRecord> listRecords() const;
    int64_t rowCount() const;

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace uptally
