#include "tokenkeeper/credentials/credential_store.h"

#include <fstream>

#include <nlohmann/json.hpp>

#define TOKENKEEPER_LOG_COMPONENT "Credentials.store"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace credentials {

namespace {

std::string joinPath(const std::string& directory, const std::string& file) {
  if (directory.empty() || directory.back() == '/') {
    return directory + file;
  }
  return directory + "/" + file;
}

// Fills `document` or returns the failure
optional<Error> readJsonFile(const std::string& path,
                             nlohmann::json& document) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(ErrorCode::CREDENTIALS_NOT_FOUND, "cannot open " + path);
  }

  try {
    document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    // Parser messages quote byte offsets only, never the content
    return Error(ErrorCode::CREDENTIALS_MALFORMED, path + ": " + e.what());
  }
  if (!document.is_object()) {
    return Error(ErrorCode::CREDENTIALS_MALFORMED,
                 path + " is not a JSON object");
  }
  return nullopt;
}

// First present key wins; empty strings count as missing
optional<std::string> readString(const nlohmann::json& document,
                                 std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = document.find(key);
    if (it != document.end() && it->is_string()) {
      std::string value = it->get<std::string>();
      if (!value.empty()) {
        return value;
      }
    }
  }
  return nullopt;
}

}  // namespace

CredentialStore::CredentialStore(const config::CredentialsSettings& settings)
    : settings_(settings) {}

CredentialStore::CredentialStore(CredentialSnapshot fixed) : fixed_(true) {
  if (fixed.loaded_at == std::chrono::system_clock::time_point()) {
    fixed.loaded_at = std::chrono::system_clock::now();
  }
  snapshot_ = std::make_shared<const CredentialSnapshot>(std::move(fixed));
}

Result<CredentialSnapshotPtr> CredentialStore::load() { return reload(); }

CredentialSnapshotPtr CredentialStore::current() const {
  return std::atomic_load(&snapshot_);
}

Result<CredentialSnapshotPtr> CredentialStore::reload() {
  std::lock_guard<std::mutex> lock(reload_mutex_);

  if (fixed_) {
    return makeSuccess(current());
  }

  auto result = readFromDisk();
  if (isError(result)) {
    TOKENKEEPER_LOG(Warning, "credential load from {} failed: {}",
                    settings_.directory, getError(result).toString());
    return result;
  }

  std::atomic_store(&snapshot_, getValue(result));
  TOKENKEEPER_LOG(Info, "credentials loaded from {}", settings_.directory);
  return result;
}

Result<CredentialSnapshotPtr> CredentialStore::readFromDisk() const {
  auto snapshot = std::make_shared<CredentialSnapshot>();

  const std::string client_path =
      joinPath(settings_.directory, settings_.client_file);
  nlohmann::json client_doc;
  if (auto error = readJsonFile(client_path, client_doc)) {
    return makeError<CredentialSnapshotPtr>(*error);
  }

  auto client_id = readString(client_doc, {"client_id"});
  auto client_secret = readString(client_doc, {"client_secret"});
  if (!client_id || !client_secret) {
    return makeError<CredentialSnapshotPtr>(
        ErrorCode::CREDENTIALS_MALFORMED,
        client_path + " needs non-empty client_id and client_secret");
  }
  snapshot->client.id = *client_id;
  snapshot->client.secret = *client_secret;

  if (!settings_.user_file.empty()) {
    const std::string user_path =
        joinPath(settings_.directory, settings_.user_file);
    nlohmann::json user_doc;
    if (auto error = readJsonFile(user_path, user_doc)) {
      return makeError<CredentialSnapshotPtr>(*error);
    }

    auto username =
        readString(user_doc, {"application_username", "username"});
    auto password =
        readString(user_doc, {"application_password", "password"});
    if (!username || !password) {
      return makeError<CredentialSnapshotPtr>(
          ErrorCode::CREDENTIALS_MALFORMED,
          user_path + " needs non-empty username and password");
    }
    snapshot->user = UserCredential{*username, *password};
  }

  snapshot->loaded_at = std::chrono::system_clock::now();
  return makeSuccess(CredentialSnapshotPtr(std::move(snapshot)));
}

}  // namespace credentials
}  // namespace tokenkeeper
