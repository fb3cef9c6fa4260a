#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace camper {

// Opaque login cookie blob handed over by the login collaborator. An
// expired credential is kept (without its stored copy) until the next login.
struct SessionCredential {
    std::string blob;
    bool expired = false;

    bool is_valid() const { return !blob.empty() && !expired; }
};

// Durable home of exactly one credential blob.
class CredentialStorage {
public:
    virtual ~CredentialStorage() = default;
    virtual std::optional<std::string> load() = 0;
    virtual void save(const std::string& blob) = 0;
    virtual void remove() = 0;
};

class FileCredentialStorage : public CredentialStorage {
public:
    explicit FileCredentialStorage(std::string path);

    std::optional<std::string> load() override;
    void save(const std::string& blob) override;
    void remove() override;

    const std::string& path() const { return file_path; }

private:
    std::string file_path;
};

// Single writer (login/logout flow and expiry detection), many concurrent
// readers. Readers get an immutable snapshot, never a half-written one.
class SessionStore {
public:
    explicit SessionStore(CredentialStorage& storage);

    // Reads the persisted credential. Called once at startup.
    void load();

    std::optional<SessionCredential> current() const;
    std::shared_ptr<const SessionCredential> snapshot() const;
    bool is_valid() const;

    // Bumped on every change, so readers can drop data derived from an
    // older credential.
    std::uint64_t revision() const;

    // Successful login. Persists the blob.
    void update(const std::string& blob);
    void logout();
    // The catalog rejected `used`, the credential a request carried. No-op
    // when a newer credential has replaced it in the meantime.
    void mark_expired(const std::shared_ptr<const SessionCredential>& used);

private:
    void replace(std::shared_ptr<const SessionCredential> next);

    CredentialStorage& storage;
    mutable std::mutex mutex;
    std::shared_ptr<const SessionCredential> credential;
    std::uint64_t revision_counter = 0;
};

} // namespace camper
