/**
 * @file mock_provider.h
 * @brief Scripted in-memory ReminderProvider for tests
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "remindd/provider/provider.h"

namespace remindd {
namespace test {

/**
 * @brief In-memory provider that records every call
 *
 * Authorization outcome, forced failures and per-call latency are set by the
 * test before the provider is used.
 */
class MockProvider : public ReminderProvider {
public:
    MockProvider() {
        lists_.push_back({"Reminders", true});
    }

    // Scripting
    void set_authorization(AuthorizationStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_error_.reset();
        auth_status_ = status;
    }

    void fail_authorization(ProviderError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_error_ = error;
    }

    // The next `times` authorization requests throw std::runtime_error
    void throw_on_authorization(int times) {
        auth_throws_ = times;
    }

    void fail_operations(std::optional<ProviderError> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        op_error_ = error;
    }

    void set_latency(std::chrono::milliseconds latency) {
        latency_ms_ = latency.count();
    }

    void set_auth_latency(std::chrono::milliseconds latency) {
        auth_latency_ms_ = latency.count();
    }

    // Inspection
    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    size_t operation_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c != "request_authorization") {
                ++n;
            }
        }
        return n;
    }

    int auth_requests() const { return auth_requests_.load(); }
    int max_concurrency() const { return max_concurrency_.load(); }

    Result<AuthorizationStatus> request_authorization() override {
        record("request_authorization");
        ++auth_requests_;
        sleep_for(auth_latency_ms_.load());
        if (auth_throws_.load() > 0) {
            --auth_throws_;
            throw std::runtime_error("scripted authorization exception");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (auth_error_) {
            return Result<AuthorizationStatus>::err(*auth_error_, "scripted authorization failure");
        }
        return Result<AuthorizationStatus>::ok(auth_status_);
    }

    Result<std::string> create(const std::string& title,
                               const std::optional<std::string>& notes,
                               const std::optional<TimePoint>& due_date,
                               const std::optional<std::string>& list_name) override {
        Busy busy(*this, "create");
        std::lock_guard<std::mutex> lock(mutex_);
        if (op_error_) {
            return Result<std::string>::err(*op_error_, "scripted failure");
        }
        std::string target = list_name.value_or("Reminders");
        if (!has_list(target)) {
            lists_.push_back({target, false});
        }
        Reminder r;
        r.id = "R-" + std::to_string(++next_id_);
        r.title = title;
        r.notes = notes;
        r.due_date = due_date;
        r.list_name = target;
        reminders_.push_back(r);
        return Result<std::string>::ok(r.id);
    }

    Result<std::vector<Reminder>> list(const std::optional<std::string>& list_name,
                                       bool include_completed) override {
        Busy busy(*this, "list");
        std::lock_guard<std::mutex> lock(mutex_);
        if (op_error_) {
            return Result<std::vector<Reminder>>::err(*op_error_, "scripted failure");
        }
        std::string target = list_name.value_or("Reminders");
        if (!has_list(target)) {
            return Result<std::vector<Reminder>>::err(ProviderError::NOT_FOUND, "no list " + target);
        }
        std::vector<Reminder> out;
        for (const auto& r : reminders_) {
            if (r.list_name == target && (include_completed || !r.completed)) {
                out.push_back(r);
            }
        }
        return Result<std::vector<Reminder>>::ok(out);
    }

    Result<bool> complete(const std::string& id) override {
        Busy busy(*this, "complete");
        std::lock_guard<std::mutex> lock(mutex_);
        if (op_error_) {
            return Result<bool>::err(*op_error_, "scripted failure");
        }
        for (auto& r : reminders_) {
            if (r.id == id) {
                r.completed = true;
                return Result<bool>::ok(true);
            }
        }
        return Result<bool>::err(ProviderError::NOT_FOUND, "no reminder " + id);
    }

    Result<std::vector<ReminderList>> lists() override {
        Busy busy(*this, "lists");
        std::lock_guard<std::mutex> lock(mutex_);
        if (op_error_) {
            return Result<std::vector<ReminderList>>::err(*op_error_, "scripted failure");
        }
        return Result<std::vector<ReminderList>>::ok(lists_);
    }

    const char* name() const override { return "mock"; }

private:
    // Tracks concurrency and applies latency around one operation
    class Busy {
    public:
        Busy(MockProvider& owner, const char* call) : owner_(owner) {
            owner_.record(call);
            int now = ++owner_.active_;
            int seen = owner_.max_concurrency_.load();
            while (now > seen && !owner_.max_concurrency_.compare_exchange_weak(seen, now)) {
            }
            sleep_for(owner_.latency_ms_.load());
        }
        ~Busy() { --owner_.active_; }

    private:
        MockProvider& owner_;
    };

    static void sleep_for(long ms) {
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }

    void record(const char* call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.emplace_back(call);
    }

    bool has_list(const std::string& name) const {
        for (const auto& l : lists_) {
            if (l.name == name) {
                return true;
            }
        }
        return false;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<Reminder> reminders_;
    std::vector<ReminderList> lists_;
    int next_id_ = 0;

    AuthorizationStatus auth_status_ = AuthorizationStatus::GRANTED;
    std::optional<ProviderError> auth_error_;
    std::optional<ProviderError> op_error_;

    std::atomic<long> latency_ms_{0};
    std::atomic<long> auth_latency_ms_{0};
    std::atomic<int> auth_requests_{0};
    std::atomic<int> auth_throws_{0};
    std::atomic<int> active_{0};
    std::atomic<int> max_concurrency_{0};
};

} // namespace test
} // namespace remindd
