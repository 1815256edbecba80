#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace taskstream {

/**
 * Bearer credential pair issued at login and replaced by each refresh
 */
struct Credential {
    std::string access_token;
    std::string refresh_token;

    bool operator==(const Credential& other) const {
        return access_token == other.access_token && refresh_token == other.refresh_token;
    }
    bool operator!=(const Credential& other) const { return !(*this == other); }
};

/**
 * Credential store error (persistent medium not writable)
 */
class CredentialStoreError : public std::runtime_error {
public:
    explicit CredentialStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Sole owner of the current credential pair.
 *
 * set() is atomic with respect to get(): a reader sees either the old pair
 * or the new pair, never a mix.
 */
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<Credential> get() const = 0;
    virtual void set(const Credential& credential) = 0;
    virtual void clear() = 0;
};

/**
 * Process-local credential store
 */
class MemoryCredentialStore : public CredentialStore {
public:
    MemoryCredentialStore() = default;
    explicit MemoryCredentialStore(const Credential& initial);

    std::optional<Credential> get() const override;
    void set(const Credential& credential) override;
    void clear() override;

private:
    mutable std::mutex mutex_;
    std::optional<Credential> credential_;
};

/**
 * Credential store persisted as a small JSON file:
 *   {"access_token": "...", "refresh_token": "..."}
 *
 * Writes go to a sibling temporary file which is then renamed over the
 * target, so a concurrent reader (or another process) never observes a
 * half-written pair. The file is created with owner-only permissions.
 */
class FileCredentialStore : public CredentialStore {
public:
    /**
     * @param path Credential file location; parent directories are created on first set()
     */
    explicit FileCredentialStore(const std::string& path);

    std::optional<Credential> get() const override;

    /**
     * @throws CredentialStoreError if the file cannot be written
     */
    void set(const Credential& credential) override;

    void clear() override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace taskstream
