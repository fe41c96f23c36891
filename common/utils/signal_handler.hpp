#ifndef CHATLIVE_SIGNAL_HANDLER_HPP
#define CHATLIVE_SIGNAL_HANDLER_HPP

/******************************************************************************
 *
 * @file       signal_handler.hpp
 * @brief      Process signal handling for graceful shutdown
 *
 * @details    The OS-level handler only records the signal. Callbacks run
 *             later on the thread that calls waitForShutdown().
 *
 *****************************************************************************/

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "log_manager.hpp"

namespace chatlive {
namespace utils {

using SignalCallback = std::function<void(int signal, const std::string& signal_name)>;

class SignalHandler {
public:
    static SignalHandler& getInstance() {
        static SignalHandler instance;
        return instance;
    }

    bool registerSignalHandler(int signal, SignalCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::signal(signal, signalHandler) == SIG_ERR) {
            return false;
        }
        callbacks_[signal].push_back(std::move(callback));
        return true;
    }

    // SIGINT, SIGTERM and SIGQUIT request shutdown; SIGPIPE is ignored
    bool registerGracefulShutdown(const SignalCallback& callback) {
        bool success = true;
        success &= registerSignalHandler(SIGINT, callback);
        success &= registerSignalHandler(SIGTERM, callback);
        success &= registerSignalHandler(SIGQUIT, callback);
        std::signal(SIGPIPE, SIG_IGN);
        return success;
    }

    bool isShutdownRequested() const { return shutdown_requested_.load(); }

    // Blocks until a shutdown signal arrives, then runs its callbacks here
    void waitForShutdown() {
        while (!shutdown_requested_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        int signal_number = last_signal_.load();
        std::vector<SignalCallback> callbacks_copy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = callbacks_.find(signal_number);
            if (it != callbacks_.end()) {
                callbacks_copy = it->second;
            }
        }

        const std::string signal_name = signalName(signal_number);
        for (const auto& callback : callbacks_copy) {
            try {
                callback(signal_number, signal_name);
            } catch (const std::exception& e) {
                LogManager::GetLogger("main")->error("Error in {} callback: {}", signal_name,
                                                     e.what());
            }
        }
    }

    // Clears a delivered shutdown request
    void reset() {
        shutdown_requested_.store(false);
        last_signal_.store(0);
    }

    void cleanup() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : callbacks_) {
            std::signal(entry.first, SIG_DFL);
        }
        callbacks_.clear();
    }

    static std::string signalName(int signal) {
        switch (signal) {
            case SIGINT:  return "SIGINT";
            case SIGTERM: return "SIGTERM";
            case SIGQUIT: return "SIGQUIT";
            case SIGHUP:  return "SIGHUP";
            default:      return "SIG" + std::to_string(signal);
        }
    }

private:
    SignalHandler() = default;
    ~SignalHandler() { cleanup(); }

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    // Async-signal-safe: atomics only
    static void signalHandler(int signal) {
        auto& instance = getInstance();
        instance.last_signal_.store(signal);
        if (signal == SIGINT || signal == SIGTERM || signal == SIGQUIT) {
            instance.shutdown_requested_.store(true);
        }
    }

    mutable std::mutex mutex_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::unordered_map<int, std::vector<SignalCallback>> callbacks_;
};

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_SIGNAL_HANDLER_HPP
