#include "auth/credential_store.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace taskstream {

MemoryCredentialStore::MemoryCredentialStore(const Credential& initial)
    : credential_(initial)
{
}

std::optional<Credential> MemoryCredentialStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_;
}

void MemoryCredentialStore::set(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_ = credential;
}

void MemoryCredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.reset();
}

FileCredentialStore::FileCredentialStore(const std::string& path)
    : path_(path)
{
}

std::optional<Credential> FileCredentialStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json doc = json::parse(file);
        Credential credential;
        credential.access_token = doc.value("access_token", "");
        credential.refresh_token = doc.value("refresh_token", "");
        if (credential.access_token.empty() && credential.refresh_token.empty()) {
            return std::nullopt;
        }
        return credential;
    } catch (const json::exception& e) {
        // Never echo file contents: they may hold a token
        Logger::get_instance().log_warning(
            "Ignoring unreadable credential file",
            {{"path", path_.string()}, {"cause", e.what()}});
        return std::nullopt;
    }
}

void FileCredentialStore::set(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw CredentialStoreError("Cannot create credential directory " +
                                       path_.parent_path().string() + ": " + ec.message());
        }
    }

    json doc = {
        {"access_token", credential.access_token},
        {"refresh_token", credential.refresh_token}
    };

    std::filesystem::path tmp_path = path_;
    tmp_path += ".tmp";

    // Restrict the temp file to the owner before any token is written to it
    std::filesystem::remove(tmp_path, ec);
    {
        std::ofstream create(tmp_path, std::ios::trunc);
        if (!create.is_open()) {
            throw CredentialStoreError("Cannot write credential file " + tmp_path.string());
        }
    }
    std::filesystem::permissions(tmp_path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        std::string cause = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw CredentialStoreError("Cannot restrict credential file " + tmp_path.string() + ": " + cause);
    }

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw CredentialStoreError("Cannot write credential file " + tmp_path.string());
        }
        file << doc.dump();
        file.flush();
        if (!file) {
            throw CredentialStoreError("Failed writing credential file " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::ostringstream oss;
        oss << "Cannot replace credential file " << path_.string() << ": " << ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw CredentialStoreError(oss.str());
    }
}

void FileCredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        Logger::get_instance().log_warning(
            "Failed to remove credential file",
            {{"path", path_.string()}, {"cause", ec.message()}});
    }
}

} // namespace taskstream
