#pragma once

#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace tdcore {

// Process-wide logger. A host application can route messages into its own
// console or status bar with SetCallback().
class Logger {
public:
    using LogCallback = std::function<void(const std::string&)>;

    // The callback runs outside the lock, so it may log or replace itself.
    static void Log(const std::string& message) {
        LogCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(message);
        } else {
            std::cout << "[tdcore] " << message << std::endl;
        }
    }

    static void SetCallback(LogCallback cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(cb);
    }

    static void ClearCallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = nullptr;
    }

private:
    static inline std::mutex mutex_;
    static inline LogCallback callback_ = nullptr;
};

} // namespace tdcore
