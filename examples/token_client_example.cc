#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "tokenkeeper/client/token_client.h"
#include "tokenkeeper/config/configuration.h"

using namespace tokenkeeper;
using namespace std::chrono_literals;

namespace {
volatile std::sig_atomic_t g_running = 1;

void signalHandler(int) { g_running = 0; }
}  // namespace

/**
 * Keeps a token fresh for one slot and prints its state every few seconds.
 *
 * Usage: TOKENKEEPER_TOKEN_PROVIDER_URL=... TOKENKEEPER_CREDENTIALS_DIR=...
 *        token_client_example [slot] [scope...]
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  std::string slot = argc > 1 ? argv[1] : "default";
  std::vector<std::string> scopes;
  for (int i = 2; i < argc; ++i) {
    scopes.push_back(argv[i]);
  }

  auto configuration = config::loadConfiguration(config::Role::Client);
  if (isError(configuration)) {
    std::cerr << "Configuration error: "
              << getError(configuration).toString() << std::endl;
    return 1;
  }

  auto created = client::TokenClient::create(getValue(configuration));
  if (isError(created)) {
    std::cerr << "Startup failed: " << getError(created).toString()
              << std::endl;
    return 1;
  }
  auto token_client = std::move(getValue(created));
  token_client->registerSlot(slot, scopes);

  while (g_running) {
    auto token = token_client->getToken(slot);
    auto state = token_client->manager().slotState(slot);
    const char* state_name =
        state ? client::slotStateToString(*state) : "unregistered";

    if (isSuccess(token)) {
      auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
          getValue(token).expires_at - std::chrono::steady_clock::now());
      std::cout << "slot " << slot << " [" << state_name
                << "] token valid for " << remaining.count() << "s"
                << std::endl;
    } else {
      std::cout << "slot " << slot << " [" << state_name
                << "]: " << getError(token).toString() << std::endl;
    }
    std::this_thread::sleep_for(5s);
  }

  token_client->shutdown();
  return 0;
}
