#include "session_store.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include "../common/paths.hpp"

namespace camper {

FileCredentialStorage::FileCredentialStorage(std::string path) : file_path(std::move(path)) {}

std::optional<std::string> FileCredentialStorage::load() {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.good()) {
        return std::nullopt;
    }
    std::string blob((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    while (!blob.empty() && (blob.back() == '\n' || blob.back() == '\r')) {
        blob.pop_back();
    }
    if (blob.empty()) {
        return std::nullopt;
    }
    return blob;
}

void FileCredentialStorage::save(const std::string& blob) {
    namespace fs = std::filesystem;
    paths::ensure_directory_exists(fs::path(file_path).parent_path().string());

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot write credential file " + file_path);
    }
    file << blob;
    file.close();

    std::error_code ec;
    fs::permissions(file_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", file_path, ec.message());
    }
}

void FileCredentialStorage::remove() {
    std::error_code ec;
    std::filesystem::remove(file_path, ec);
    if (ec) {
        spdlog::warn("Could not remove credential file {}: {}", file_path, ec.message());
    }
}

SessionStore::SessionStore(CredentialStorage& storage) : storage(storage) {}

void SessionStore::load() {
    auto blob = storage.load();
    if (!blob) {
        spdlog::info("No stored session, login required");
        replace(nullptr);
        return;
    }
    spdlog::info("Loaded stored session");
    replace(std::make_shared<const SessionCredential>(SessionCredential{*blob, false}));
}

std::optional<SessionCredential> SessionStore::current() const {
    auto cred = snapshot();
    if (!cred) {
        return std::nullopt;
    }
    return *cred;
}

std::shared_ptr<const SessionCredential> SessionStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return credential;
}

bool SessionStore::is_valid() const {
    auto cred = snapshot();
    return cred && cred->is_valid();
}

std::uint64_t SessionStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex);
    return revision_counter;
}

void SessionStore::update(const std::string& blob) {
    if (blob.empty()) {
        throw std::invalid_argument("empty session credential");
    }
    storage.save(blob);
    replace(std::make_shared<const SessionCredential>(SessionCredential{blob, false}));
    spdlog::info("Session credential updated");
}

void SessionStore::logout() {
    storage.remove();
    replace(nullptr);
    spdlog::info("Logged out");
}

void SessionStore::mark_expired(const std::shared_ptr<const SessionCredential>& used) {
    std::shared_ptr<const SessionCredential> expired;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!credential || credential != used || credential->expired) {
            return;
        }
        expired = std::make_shared<const SessionCredential>(SessionCredential{credential->blob, true});
    }
    spdlog::warn("Session credential expired, removing it");
    storage.remove();
    replace(std::move(expired));
}

void SessionStore::replace(std::shared_ptr<const SessionCredential> next) {
    std::lock_guard<std::mutex> lock(mutex);
    credential = std::move(next);
    ++revision_counter;
}

} // namespace camper
