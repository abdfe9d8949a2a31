#include "FileStorage.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SGSTORE1";

FileStorage::FileStorage(const std::string& path)
    : file_path(path)
{
    spdlog::info("FileStorage initialized with store file '{}'", file_path);
}

bool FileStorage::load() {
    spdlog::info("Loading store from '{}'", file_path);
    std::ifstream in(file_path);
    if (!in) {
        spdlog::warn("Store file '{}' not found; treating as empty", file_path);
        return true;
    }

    std::ostringstream oss;
    oss << in.rdbuf();

    std::lock_guard<std::mutex> lock(mtx);
    if (!parse(oss.str())) {
        spdlog::error("Store file '{}' is malformed; starting empty", file_path);
        users.clear();
        user_by_email.clear();
        sessions.clear();
        verifications.clear();
        return false;
    }

    spdlog::info("Loaded {} users, {} sessions, {} verification codes",
        users.size(), sessions.size(), verifications.size());
    return true;
}

// Caller holds mtx.
bool FileStorage::commit() {
    const std::string tmp = file_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing store data", tmp);
            return false;
        }
        out << serialize();
        out.flush();
        if (!out) {
            spdlog::error("Failed writing store data to '{}'", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, file_path, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", file_path, ec.message());
        return false;
    }
    return true;
}

std::string FileStorage::serialize() const {
    std::ostringstream oss;
    oss << MAGIC_HDR << "\n";

    oss << "users " << users.size() << "\n";
    for (const auto& p : users) {
        const User& u = p.second;
        oss << u.id << "\n"
            << u.name << "\n"
            << u.email << "\n"
            << u.password_hash << "\n"
            << u.email_verified_at << "\n"
            << u.created_at << "\n"
            << u.last_password_change << "\n"
            << "---\n";
    }

    oss << "sessions " << sessions.size() << "\n";
    for (const auto& p : sessions) {
        const Session& s = p.second;
        oss << s.id << "\n"
            << s.user_id << "\n"
            << s.access_token << "\n"
            << s.refresh_token << "\n"
            << s.created_at << "\n"
            << s.expires_at << "\n"
            << s.refresh_expires_at << "\n"
            << s.last_active << "\n"
            << s.revoked_at << "\n"
            << "---\n";
    }

    oss << "verifications " << verifications.size() << "\n";
    for (const auto& p : verifications) {
        const VerificationRequest& v = p.second;
        oss << v.user_id << "\n"
            << v.code << "\n"
            << v.expires_at << "\n"
            << "---\n";
    }

    return oss.str();
}

static bool readNumber(std::istream& in, long long& out) {
    std::string line;
    if (!std::getline(in, line)) return false;
    try {
        size_t used = 0;
        out = std::stoll(line, &used);
        return used == line.size();
    }
    catch (const std::logic_error&) {
        return false;
    }
}

static bool readTime(std::istream& in, std::time_t& out) {
    long long v = 0;
    if (!readNumber(in, v)) return false;
    out = static_cast<std::time_t>(v);
    return true;
}

// Reads "<name> <count>".
static bool readSection(std::istream& in, const std::string& name, size_t& count) {
    std::string line;
    if (!std::getline(in, line)) return false;
    std::istringstream iss(line);
    std::string tag;
    if (!(iss >> tag >> count) || tag != name) return false;
    return true;
}

static bool readSeparator(std::istream& in) {
    std::string sep;
    return std::getline(in, sep) && sep == "---";
}

// Caller holds mtx.
bool FileStorage::parse(const std::string& text) {
    std::istringstream in(text);
    std::string hdr;
    if (!std::getline(in, hdr) || hdr != MAGIC_HDR) {
        spdlog::error("Invalid store header");
        return false;
    }

    users.clear();
    user_by_email.clear();
    sessions.clear();
    verifications.clear();

    size_t count = 0;
    if (!readSection(in, "users", count)) return false;
    for (size_t i = 0; i < count; ++i) {
        User u;
        if (!std::getline(in, u.id)) return false;
        if (!std::getline(in, u.name)) return false;
        if (!std::getline(in, u.email)) return false;
        if (!std::getline(in, u.password_hash)) return false;
        if (!readTime(in, u.email_verified_at)) return false;
        if (!readTime(in, u.created_at)) return false;
        if (!readTime(in, u.last_password_change)) return false;
        if (!readSeparator(in)) return false;

        user_by_email[u.email] = u.id;
        users[u.id] = u;
    }

    if (!readSection(in, "sessions", count)) return false;
    for (size_t i = 0; i < count; ++i) {
        Session s;
        if (!std::getline(in, s.id)) return false;
        if (!std::getline(in, s.user_id)) return false;
        if (!std::getline(in, s.access_token)) return false;
        if (!std::getline(in, s.refresh_token)) return false;
        if (!readTime(in, s.created_at)) return false;
        if (!readTime(in, s.expires_at)) return false;
        if (!readTime(in, s.refresh_expires_at)) return false;
        if (!readTime(in, s.last_active)) return false;
        if (!readTime(in, s.revoked_at)) return false;
        if (!readSeparator(in)) return false;

        sessions[s.id] = s;
    }

    if (!readSection(in, "verifications", count)) return false;
    for (size_t i = 0; i < count; ++i) {
        VerificationRequest v;
        long long code = 0;
        if (!std::getline(in, v.user_id)) return false;
        if (!readNumber(in, code)) return false;
        if (!readTime(in, v.expires_at)) return false;
        if (!readSeparator(in)) return false;

        v.code = static_cast<int>(code);
        verifications[v.user_id] = v;
    }

    return true;
}
