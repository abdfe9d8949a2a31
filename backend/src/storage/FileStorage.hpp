#pragma once
#include <string>
#include "MemoryStorage.hpp"

// MemoryStorage that mirrors its tables to a text file after every mutation.
//
// File layout (one field per line, records closed by "---"):
//   Header: "SGSTORE1"
//   "users <n>"          then n records: id, name, email, password_hash,
//                        email_verified_at, created_at, last_password_change
//   "sessions <n>"       then n records: id, user_id, access_token, refresh_token,
//                        created_at, expires_at, refresh_expires_at, last_active, revoked_at
//   "verifications <n>"  then n records: user_id, code, expires_at
//
// Writes go to "<path>.tmp" and are renamed over the file so a crash never
// leaves a half-written store behind.
class FileStorage : public MemoryStorage {
public:
    explicit FileStorage(const std::string& path);

    // Reads the file into memory. A missing file is an empty store.
    // Returns false (and leaves the store empty) when the file is malformed.
    bool load();

    const std::string& path() const { return file_path; }

protected:
    bool commit() override;

private:
    std::string file_path;

    std::string serialize() const;
    bool parse(const std::string& text);
};
