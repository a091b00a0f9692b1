#include "tokenkeeper/client/token_lifecycle_manager.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>

#define TOKENKEEPER_LOG_COMPONENT "Lifecycle.manager"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace client {

namespace {

std::chrono::milliseconds delayUntil(event::MonotonicTime deadline,
                                     event::MonotonicTime now) {
  if (deadline <= now) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

}  // namespace

const char* slotStateToString(SlotState state) {
  switch (state) {
    case SlotState::Empty: return "empty";
    case SlotState::Acquiring: return "acquiring";
    case SlotState::Valid: return "valid";
    case SlotState::Refreshing: return "refreshing";
    case SlotState::Warning: return "warning";
    case SlotState::Expired: return "expired";
  }
  return "unknown";
}

class TokenLifecycleManager::Impl
    : public std::enable_shared_from_this<TokenLifecycleManager::Impl> {
 public:
  struct TokenEntry {
    AccessToken token;
    // Increases by one with every token installed in the slot
    uint64_t generation;
  };
  using TokenEntryPtr = std::shared_ptr<const TokenEntry>;

  struct Slot {
    Slot(std::string slot_name,
         std::vector<std::string> slot_scopes,
         std::chrono::milliseconds backoff)
        : name(std::move(slot_name)),
          scopes(std::move(slot_scopes)),
          next_backoff(backoff) {}

    TokenEntryPtr currentEntry() const { return std::atomic_load(&entry); }

    void setError(optional<Error> error) {
      std::lock_guard<std::mutex> lock(error_mutex);
      last_error = std::move(error);
    }

    optional<Error> error() const {
      std::lock_guard<std::mutex> lock(error_mutex);
      return last_error;
    }

    const std::string name;
    const std::vector<std::string> scopes;

    TokenEntryPtr entry;  // std::atomic_load/std::atomic_store only
    std::atomic<uint64_t> generation{0};
    std::atomic<SlotState> state{SlotState::Empty};
    // Completed acquisition attempts
    std::atomic<uint64_t> attempts{0};
    // A background retry is scheduled for a slot with no valid token
    std::atomic<bool> retry_pending{false};
    std::atomic<uint64_t> warned_generation{0};
    std::atomic<uint64_t> expired_generation{0};

    // Held across the provider call
    std::mutex acquire_mutex;

    mutable std::mutex error_mutex;
    optional<Error> last_error;

    // Generation the timers were last armed for. Written on the dispatcher.
    std::atomic<uint64_t> armed_generation{0};
    // A background refresh has been handed to the executor
    std::atomic<bool> refresh_queued{false};

    // Dispatcher thread only
    event::TimerPtr refresh_timer;
    event::TimerPtr warning_timer;
    event::TimerPtr expiry_timer;
    std::chrono::milliseconds next_backoff;
  };
  using SlotPtr = std::shared_ptr<Slot>;

  Impl(const config::TokenManagerSettings& settings,
       credentials::CredentialStore& credentials,
       TokenProvider& provider,
       event::Dispatcher& dispatcher,
       SlotExecutor& executor,
       std::shared_ptr<LifecycleObserver> observer)
      : settings_(settings),
        credentials_(credentials),
        provider_(provider),
        dispatcher_(dispatcher),
        executor_(executor),
        time_(dispatcher.timeSource()),
        observer_(std::move(observer)) {}

  bool registerSlot(const std::string& name,
                    const std::vector<std::string>& scopes) {
    if (shut_down_) {
      TOKENKEEPER_LOG_WARNING("Ignoring slot '{}' registered after shutdown",
                              name);
      return false;
    }

    SlotPtr slot;
    {
      std::lock_guard<std::mutex> lock(slots_mutex_);
      if (slots_.count(name) != 0) {
        TOKENKEEPER_LOG_WARNING(
            "Slot '{}' is already registered; keeping its scopes", name);
        return false;
      }
      slot = std::make_shared<Slot>(name, scopes, settings_.initial_backoff);
      slots_.emplace(name, slot);
    }
    TOKENKEEPER_LOG_INFO("Registered token slot '{}' with {} scope(s)", name,
                         scopes.size());

    if (settings_.warm_up) {
      std::weak_ptr<Impl> weak = shared_from_this();
      dispatcher_.post([weak, slot]() {
        if (auto self = weak.lock()) {
          self->scheduleRefresh(*slot);
        }
      });
    }
    return true;
  }

  Result<AccessToken> getToken(const std::string& name) {
    SlotPtr slot = findSlot(name);
    if (!slot) {
      return makeError<AccessToken>(ErrorCode::TOKEN_UNKNOWN_SLOT,
                                    "no slot named '" + name + "'");
    }

    TokenEntryPtr entry = slot->currentEntry();
    const event::MonotonicTime now = time_.monotonicTime();
    if (entry && entry->token.isValidAt(now)) {
      return Result<AccessToken>(entry->token);
    }
    if (entry) {
      markExpired(*slot, *entry, now);
    }
    if (shut_down_) {
      return shutDownError();
    }
    if (slot->retry_pending) {
      return failureFor(*slot, entry);
    }
    return acquireForReader(slot);
  }

  optional<SlotState> slotState(const std::string& name) const {
    SlotPtr slot = findSlot(name);
    if (!slot) {
      return nullopt;
    }
    return slot->state.load();
  }

  optional<Error> lastError(const std::string& name) const {
    SlotPtr slot = findSlot(name);
    if (!slot) {
      return nullopt;
    }
    return slot->error();
  }

  std::vector<std::string> slotNames() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::vector<std::string> names;
    names.reserve(slots_.size());
    for (const auto& entry : slots_) {
      names.push_back(entry.first);
    }
    return names;
  }

  void shutdown() {
    if (shut_down_.exchange(true)) {
      return;
    }
    TOKENKEEPER_LOG_INFO("Shutting down token lifecycle manager");

    if (dispatcher_.isThreadSafe()) {
      cancelAllTimers();
      return;
    }
    // Timers belong to the dispatcher thread. The callback keeps this
    // object alive until they are cancelled.
    auto self = shared_from_this();
    dispatcher_.post([self]() { self->cancelAllTimers(); });
  }

 private:
  SlotPtr findSlot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(name);
    return it == slots_.end() ? nullptr : it->second;
  }

  static Result<AccessToken> shutDownError() {
    return makeError<AccessToken>(ErrorCode::TOKEN_MANAGER_SHUT_DOWN,
                                  "token manager is shut down");
  }

  Result<AccessToken> failureFor(const Slot& slot,
                                 const TokenEntryPtr& entry) const {
    std::string detail;
    if (auto error = slot.error()) {
      detail = "; last attempt: " + error->toString();
    }
    if (entry) {
      return makeError<AccessToken>(
          ErrorCode::TOKEN_EXPIRED,
          "token for slot '" + slot.name + "' expired" + detail);
    }
    return makeError<AccessToken>(
        ErrorCode::TOKEN_UNAVAILABLE,
        "no token acquired for slot '" + slot.name + "'" + detail);
  }

  // The caller has no valid token. Either run the acquisition or, when one
  // finished while we waited for the lock, report its outcome.
  Result<AccessToken> acquireForReader(const SlotPtr& slot) {
    const uint64_t seen = slot->attempts.load();
    uint64_t installed = 0;
    uint64_t attempt_id = 0;
    {
      std::lock_guard<std::mutex> lock(slot->acquire_mutex);
      TokenEntryPtr entry = slot->currentEntry();
      if (entry && entry->token.isValidAt(time_.monotonicTime())) {
        return Result<AccessToken>(entry->token);
      }
      if (shut_down_) {
        return shutDownError();
      }
      if (slot->attempts.load() != seen) {
        return failureFor(*slot, entry);
      }
      installed = attempt(*slot);
      attempt_id = slot->attempts.load();
    }

    // Timers are armed on the dispatcher thread
    std::weak_ptr<Impl> weak = shared_from_this();
    SlotPtr held = slot;
    dispatcher_.post([weak, held, attempt_id, installed]() {
      if (auto self = weak.lock()) {
        self->afterAttempt(*held, attempt_id, installed);
      }
    });

    if (shut_down_) {
      return shutDownError();
    }
    TokenEntryPtr entry = slot->currentEntry();
    if (installed != 0 && entry &&
        entry->token.isValidAt(time_.monotonicTime())) {
      return Result<AccessToken>(entry->token);
    }
    return failureFor(*slot, entry);
  }

  Result<AccessToken> acquireFromProvider(const Slot& slot) {
    credentials::CredentialSnapshotPtr credentials = credentials_.current();
    if (!credentials) {
      return makeError<AccessToken>(ErrorCode::CREDENTIALS_NOT_FOUND,
                                    "no credentials loaded");
    }
    return provider_.acquire(*credentials, slot.scopes);
  }

  // One acquisition. Requires acquire_mutex. Returns the generation of the
  // installed token or 0 when nothing was installed.
  uint64_t attempt(Slot& slot) {
    const TokenEntryPtr previous = slot.currentEntry();
    const bool replacing =
        previous && previous->token.isValidAt(time_.monotonicTime());
    slot.state = replacing ? SlotState::Refreshing : SlotState::Acquiring;

    Result<AccessToken> result = acquireFromProvider(slot);
    slot.attempts.fetch_add(1);
    const event::MonotonicTime now = time_.monotonicTime();

    if (shut_down_) {
      TOKENKEEPER_LOG_DEBUG("Discarding acquisition result for slot '{}'",
                            slot.name);
      settle(slot, previous, now);
      return 0;
    }

    if (isSuccess(result)) {
      auto entry = std::make_shared<TokenEntry>();
      entry->token = std::move(getValue(result));
      entry->generation = slot.generation.fetch_add(1) + 1;
      std::atomic_store(&slot.entry, TokenEntryPtr(entry));
      slot.state = SlotState::Valid;
      slot.setError(nullopt);
      emit(replacing ? LifecycleEventType::Refreshed
                     : LifecycleEventType::Acquired,
           slot, now, &entry->token, nullptr);
      return entry->generation;
    }

    const Error& error = getError(result);
    slot.setError(error);
    emit(LifecycleEventType::ProviderUnavailable, slot, now, nullptr, &error);
    settle(slot, previous, now);
    return 0;
  }

  // State after an attempt that installed nothing
  void settle(Slot& slot,
              const TokenEntryPtr& previous,
              event::MonotonicTime now) {
    if (!previous) {
      slot.state = SlotState::Empty;
      return;
    }
    if (previous->token.isValidAt(now)) {
      slot.state = slot.warned_generation.load() == previous->generation
                       ? SlotState::Warning
                       : SlotState::Valid;
      return;
    }
    slot.state = SlotState::Expired;
    markExpired(slot, *previous, now);
  }

  // Emits Expired at most once per token
  void markExpired(Slot& slot,
                   const TokenEntry& entry,
                   event::MonotonicTime now) {
    if (slot.expired_generation.exchange(entry.generation) ==
        entry.generation) {
      return;
    }
    if (slot.currentEntry().get() == &entry) {
      slot.state = SlotState::Expired;
    }
    TOKENKEEPER_LOG_DEBUG("Token generation {} of slot '{}' expired",
                          entry.generation, slot.name);
    emit(LifecycleEventType::Expired, slot, now, &entry.token, nullptr);
  }

  void ensureTimers(Slot& slot) {
    if (slot.refresh_timer) {
      return;
    }
    // Timers are owned by the slot, which this object owns
    Slot* raw = &slot;
    slot.refresh_timer =
        dispatcher_.createTimer([this, raw]() { scheduleRefresh(*raw); });
    slot.warning_timer =
        dispatcher_.createTimer([this, raw]() { onWarningTimer(*raw); });
    slot.expiry_timer =
        dispatcher_.createTimer([this, raw]() { onExpiryTimer(*raw); });
  }

  // Warm-up, scheduled refresh and background retry. The provider call
  // runs on the executor so the dispatcher never waits on the network.
  void scheduleRefresh(Slot& slot) {
    if (shut_down_) {
      return;
    }
    ensureTimers(slot);
    if (slot.refresh_queued.exchange(true)) {
      return;
    }
    std::weak_ptr<Impl> weak = shared_from_this();
    Slot* raw = &slot;
    executor_.post(slot.name, [weak, raw]() {
      if (auto self = weak.lock()) {
        self->refreshOnExecutor(*raw);
      }
    });
  }

  void refreshOnExecutor(Slot& slot) {
    slot.refresh_queued = false;
    if (shut_down_) {
      return;
    }

    uint64_t installed = 0;
    uint64_t attempt_id = 0;
    {
      std::lock_guard<std::mutex> lock(slot.acquire_mutex);
      TokenEntryPtr entry = slot.currentEntry();
      const event::MonotonicTime now = time_.monotonicTime();
      const bool valid = entry && entry->token.isValidAt(now);

      if (valid && entry->generation != slot.armed_generation) {
        // Installed by a reader whose follow-up is still queued
        installed = entry->generation;
      } else if (valid && now < entry->token.pointInLifetime(
                                    settings_.refresh_factor)) {
        const event::MonotonicTime refresh_at =
            entry->token.pointInLifetime(settings_.refresh_factor);
        std::weak_ptr<Impl> weak = shared_from_this();
        Slot* raw = &slot;
        dispatcher_.post([weak, raw, refresh_at]() {
          if (auto self = weak.lock()) {
            self->rearmRefresh(*raw, refresh_at);
          }
        });
        return;
      } else {
        installed = attempt(slot);
      }
      attempt_id = slot.attempts.load();
    }

    std::weak_ptr<Impl> weak = shared_from_this();
    Slot* raw = &slot;
    dispatcher_.post([weak, raw, attempt_id, installed]() {
      if (auto self = weak.lock()) {
        self->afterAttempt(*raw, attempt_id, installed);
      }
    });
  }

  void rearmRefresh(Slot& slot, event::MonotonicTime refresh_at) {
    if (shut_down_) {
      return;
    }
    slot.refresh_timer->enableTimer(
        delayUntil(refresh_at, time_.monotonicTime()));
  }

  // Schedules the next step for a slot once an attempt is over
  void afterAttempt(Slot& slot, uint64_t attempt_id, uint64_t installed) {
    if (shut_down_ || slot.attempts.load() != attempt_id) {
      // A newer attempt schedules its own follow-up
      return;
    }
    ensureTimers(slot);

    TokenEntryPtr entry = slot.currentEntry();
    const event::MonotonicTime now = time_.monotonicTime();
    if (entry && entry->token.isValidAt(now)) {
      if (entry->generation != slot.armed_generation) {
        arm(slot, *entry, now);
        return;
      }
      if (installed != 0) {
        return;
      }
      scheduleRetry(slot, entry.get(), now);
      return;
    }
    scheduleRetry(slot, nullptr, now);
  }

  void arm(Slot& slot, const TokenEntry& entry, event::MonotonicTime now) {
    slot.armed_generation = entry.generation;
    slot.next_backoff = settings_.initial_backoff;
    slot.retry_pending = false;

    const AccessToken& token = entry.token;
    slot.refresh_timer->enableTimer(
        delayUntil(token.pointInLifetime(settings_.refresh_factor), now));
    slot.warning_timer->enableTimer(
        delayUntil(token.pointInLifetime(settings_.warning_factor), now));
    slot.expiry_timer->enableTimer(delayUntil(token.expires_at, now));
  }

  // `current` is the still-valid token, or nullptr when there is none
  void scheduleRetry(Slot& slot,
                     const TokenEntry* current,
                     event::MonotonicTime now) {
    const std::chrono::milliseconds delay = slot.next_backoff;
    slot.next_backoff = std::min(delay * 2, settings_.max_backoff);

    if (current != nullptr) {
      if (now + delay >= current->token.expires_at) {
        slot.refresh_timer->disableTimer();
        TOKENKEEPER_LOG_WARNING(
            "No refresh retry for slot '{}' fits before its token expires",
            slot.name);
        return;
      }
    } else {
      slot.retry_pending = true;
    }
    TOKENKEEPER_LOG_DEBUG("Retrying slot '{}' in {}ms", slot.name,
                          delay.count());
    slot.refresh_timer->enableTimer(delay);
  }

  void onWarningTimer(Slot& slot) {
    if (shut_down_) {
      return;
    }
    TokenEntryPtr entry = slot.currentEntry();
    const event::MonotonicTime now = time_.monotonicTime();
    if (!entry || entry->generation != slot.armed_generation ||
        !entry->token.isValidAt(now)) {
      return;
    }
    const event::MonotonicTime warn_at =
        entry->token.pointInLifetime(settings_.warning_factor);
    if (now < warn_at) {
      slot.warning_timer->enableTimer(delayUntil(warn_at, now));
      return;
    }
    if (slot.warned_generation.exchange(entry->generation) ==
        entry->generation) {
      return;
    }
    SlotState expected = SlotState::Valid;
    slot.state.compare_exchange_strong(expected, SlotState::Warning);
    emit(LifecycleEventType::Warning, slot, now, &entry->token, nullptr);
  }

  void onExpiryTimer(Slot& slot) {
    if (shut_down_) {
      return;
    }
    TokenEntryPtr entry = slot.currentEntry();
    const event::MonotonicTime now = time_.monotonicTime();
    if (!entry) {
      return;
    }
    if (entry->token.isValidAt(now)) {
      if (entry->generation == slot.armed_generation) {
        slot.expiry_timer->enableTimer(
            delayUntil(entry->token.expires_at, now));
      }
      return;
    }
    // Reads acquire on demand from here on
    slot.refresh_timer->disableTimer();
    slot.retry_pending = false;
    markExpired(slot, *entry, now);
  }

  void cancelAllTimers() {
    std::vector<SlotPtr> slots;
    {
      std::lock_guard<std::mutex> lock(slots_mutex_);
      for (const auto& entry : slots_) {
        slots.push_back(entry.second);
      }
    }
    for (const auto& slot : slots) {
      if (slot->refresh_timer) {
        slot->refresh_timer->disableTimer();
        slot->warning_timer->disableTimer();
        slot->expiry_timer->disableTimer();
      }
      slot->retry_pending = false;
    }
  }

  void emit(LifecycleEventType type,
            const Slot& slot,
            event::MonotonicTime at,
            const AccessToken* token,
            const Error* error) {
    if (!observer_) {
      return;
    }
    LifecycleEvent event;
    event.type = type;
    event.slot = slot.name;
    event.at = at;
    if (token != nullptr) {
      event.expires_at = token->expires_at;
    }
    if (error != nullptr) {
      event.error = *error;
    }
    observer_->onLifecycleEvent(event);
  }

  const config::TokenManagerSettings settings_;
  credentials::CredentialStore& credentials_;
  TokenProvider& provider_;
  event::Dispatcher& dispatcher_;
  SlotExecutor& executor_;
  const event::TimeSource& time_;
  std::shared_ptr<LifecycleObserver> observer_;

  mutable std::mutex slots_mutex_;
  std::map<std::string, SlotPtr> slots_;
  std::atomic<bool> shut_down_{false};
};

TokenLifecycleManager::TokenLifecycleManager(
    const config::TokenManagerSettings& settings,
    credentials::CredentialStore& credentials,
    TokenProvider& provider,
    event::Dispatcher& dispatcher,
    SlotExecutor& executor,
    std::shared_ptr<LifecycleObserver> observer) {
  if (!(settings.refresh_factor > 0.0 &&
        settings.refresh_factor < settings.warning_factor &&
        settings.warning_factor < 1.0)) {
    throw std::invalid_argument(
        "token manager requires 0 < refresh_factor < warning_factor < 1");
  }
  if (settings.initial_backoff.count() <= 0 ||
      settings.max_backoff < settings.initial_backoff) {
    throw std::invalid_argument(
        "token manager requires 0 < initial_backoff <= max_backoff");
  }
  impl_ = std::make_shared<Impl>(settings, credentials, provider, dispatcher,
                                 executor, std::move(observer));
}

TokenLifecycleManager::~TokenLifecycleManager() {
  if (impl_) {
    impl_->shutdown();
  }
}

bool TokenLifecycleManager::registerSlot(
    const std::string& name, const std::vector<std::string>& scopes) {
  return impl_->registerSlot(name, scopes);
}

Result<AccessToken> TokenLifecycleManager::getToken(const std::string& name) {
  return impl_->getToken(name);
}

optional<SlotState> TokenLifecycleManager::slotState(
    const std::string& name) const {
  return impl_->slotState(name);
}

optional<Error> TokenLifecycleManager::lastError(
    const std::string& name) const {
  return impl_->lastError(name);
}

std::vector<std::string> TokenLifecycleManager::slotNames() const {
  return impl_->slotNames();
}

void TokenLifecycleManager::shutdown() { impl_->shutdown(); }

}  // namespace client
}  // namespace tokenkeeper
