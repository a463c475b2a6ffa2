#include "SignalManager.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::mutex cb_mutex;
static std::atomic<int> received_signal{0};

static void signal_handler(int signum) {
    received_signal = signum;

    std::lock_guard<std::mutex> lock(cb_mutex);
    auto it = callbacks.find(signum);
    if (it == callbacks.end()) {
        return;
    }
    for (auto& cb : it->second.normal_callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        it->second.final_callback.value()(signum);
    }
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, signal_handler);
    }
}

void reset() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, SIG_DFL);
    }
    callbacks.clear();
    received_signal = 0;
}

int last_signal() {
    return received_signal.load();
}

}
