#ifndef TOKENKEEPER_CREDENTIALS_CREDENTIAL_STORE_H
#define TOKENKEEPER_CREDENTIALS_CREDENTIAL_STORE_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"

/**
 * @file credential_store.h
 * @brief Client and user credential material loaded from a directory
 */

namespace tokenkeeper {
namespace credentials {

struct ClientCredential {
  std::string id;
  std::string secret;
};

struct UserCredential {
  std::string username;
  std::string password;
};

/**
 * @brief Immutable result of one successful load
 *
 * `user` is absent when the store was configured without a user file.
 */
struct CredentialSnapshot {
  ClientCredential client;
  optional<UserCredential> user;
  std::chrono::system_clock::time_point loaded_at;
};

using CredentialSnapshotPtr = std::shared_ptr<const CredentialSnapshot>;

/**
 * @brief Holds the current credential snapshot
 *
 * Client file: {"client_id": "...", "client_secret": "..."}
 * User file:   {"application_username": "...", "application_password": "..."}
 *              ("username"/"password" are accepted as well)
 *
 * Readers get the snapshot through current() without I/O or locking on the
 * reload path. load()/reload() are serialized against each other and swap
 * the snapshot in one step, so an acquisition that already holds the old
 * snapshot finishes with it.
 */
class CredentialStore {
 public:
  explicit CredentialStore(const config::CredentialsSettings& settings);

  /**
   * @brief Store over fixed credentials; reload() returns them unchanged
   */
  explicit CredentialStore(CredentialSnapshot fixed);

  /**
   * @brief Initial read. Fails with CREDENTIALS_NOT_FOUND or
   * CREDENTIALS_MALFORMED; nothing is installed on failure.
   */
  Result<CredentialSnapshotPtr> load();

  /**
   * @brief Latest snapshot, nullptr before the first successful load
   */
  CredentialSnapshotPtr current() const;

  /**
   * @brief Re-read and swap. On failure the previous snapshot stays in
   * effect and the error is returned.
   */
  Result<CredentialSnapshotPtr> reload();

  const config::CredentialsSettings& settings() const { return settings_; }

 private:
  Result<CredentialSnapshotPtr> readFromDisk() const;

  config::CredentialsSettings settings_;
  bool fixed_{false};
  std::mutex reload_mutex_;
  CredentialSnapshotPtr snapshot_;  // accessed with std::atomic_load/store
};

}  // namespace credentials
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CREDENTIALS_CREDENTIAL_STORE_H
