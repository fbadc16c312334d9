/*
 * RoomRelay - test helpers
 */

#pragma once

#include "connection.hpp"
#include "crypto.hpp"
#include "hub.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomrelay::testing {

// In-memory connection: records what the hub writes and can be told to fail.
class FakeConnection : public Connection {
public:
    explicit FakeConnection(std::string name = "fake") : name_(std::move(name)) {}

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (throwing_) {
            throw std::runtime_error("send failed on " + name_);
        }
        if (broken_ || closed_) {
            return false;
        }
        sent_.push_back(text);
        return true;
    }

    std::optional<std::string> receive_text() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !inbox_.empty(); });
        if (inbox_.empty()) {
            return std::nullopt;
        }
        std::string text = std::move(inbox_.front());
        inbox_.pop_front();
        return text;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    std::string describe() const override { return name_; }

    void push_inbound(std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_.push_back(std::move(text));
        cv_.notify_all();
    }

    void break_writes() {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_ = true;
    }

    void throw_on_send() {
        std::lock_guard<std::mutex> lock(mutex_);
        throwing_ = true;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::string last_sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.empty() ? std::string() : sent_.back();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    std::vector<std::string> sent_;
    bool broken_ = false;
    bool throwing_ = false;
    bool closed_ = false;
};

// Cheap hashing keeps password tests fast.
inline PasswordHasher fast_hasher() {
    return [](const std::string& password) { return hash_password(password, 1000); };
}

inline JoinRequest join_request(const std::string& room,
                                const std::string& username,
                                const std::string& action = kActionJoin,
                                const std::string& password = "",
                                bool is_private = false) {
    JoinRequest request;
    request.room = room;
    request.username = username;
    request.action = action;
    request.password = password;
    request.is_private = is_private;
    return request;
}

} // namespace roomrelay::testing
