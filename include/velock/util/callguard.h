// VELOCK - External Call Guard
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Commands hold their object's mutex while calling out to external code
// (asset transfers, proposal executors). If that code calls back into the
// same object on the same thread, locking again would deadlock. The guard
// records which thread is inside an external call so the re-entrant call
// can be rejected instead.

#ifndef VELOCK_UTIL_CALLGUARD_H
#define VELOCK_UTIL_CALLGUARD_H

#include <atomic>
#include <thread>

namespace velock {
namespace util {

class ExternalCallGuard {
public:
    /// True while the calling thread is inside a Scope of this guard
    bool IsCurrentThreadInside() const {
        return owner_.load() == std::this_thread::get_id();
    }

    /// Marks the current thread as inside an external call
    class Scope {
    public:
        explicit Scope(ExternalCallGuard& guard) : guard_(guard) {
            guard_.owner_.store(std::this_thread::get_id());
        }
        ~Scope() { guard_.owner_.store(std::thread::id()); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ExternalCallGuard& guard_;
    };

private:
    std::atomic<std::thread::id> owner_{std::thread::id()};
};

} // namespace util
} // namespace velock

#endif // VELOCK_UTIL_CALLGUARD_H
