#pragma once
#include <functional>
#include <csignal>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run in registration order, the final callback (if any) runs last
void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Install the handler for every signal that has callbacks
void setup();

// Drop all callbacks and restore the default disposition
void reset();

// Last signal delivered through the manager, 0 if none
int last_signal();

}
