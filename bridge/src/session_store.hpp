/**
 * session_store.hpp — Per-session coaching state, keyed by session id
 *
 * Sessions are created on first access through the factory supplied at
 * construction, so an unknown id is never an error. Each session has its
 * own lock: ticks for the same session are serialized by with_session(),
 * ticks for different sessions proceed in parallel.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include "session_state.hpp"

namespace interview_coach {

class SessionStore {
public:
    using SessionFactory = std::function<SessionState(const std::string& session_id)>;

    explicit SessionStore(SessionFactory factory);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * Snapshot of a session, creating it if absent.
     */
    SessionState get(const std::string& session_id);

    /**
     * Replace a session's state, creating the entry if absent.
     */
    void update(const std::string& session_id, SessionState state);

    /**
     * Forget a session. Returns false if it did not exist.
     */
    bool remove(const std::string& session_id);

    /**
     * Forget every session whose last tick is more than `idle_timeout_ms`
     * before `now_ms`. Returns the number removed.
     */
    std::size_t remove_idle(int64_t now_ms, int64_t idle_timeout_ms);

    bool contains(const std::string& session_id) const;
    std::size_t size() const;

    /**
     * Run `fn(SessionState&)` while holding the session's lock, creating
     * the session if absent. `fn` must not call back into the store.
     */
    template <typename Fn>
    auto with_session(const std::string& session_id, Fn&& fn)
        -> decltype(fn(std::declval<SessionState&>()))
    {
        std::shared_ptr<Entry> entry = acquire(session_id);
        absl::MutexLock lock(&entry->mutex);
        return std::forward<Fn>(fn)(entry->state);
    }

private:
    struct Entry {
        absl::Mutex mutex;
        SessionState state ABSL_GUARDED_BY(mutex);
    };

    std::shared_ptr<Entry> acquire(const std::string& session_id);

    SessionFactory factory_;

    mutable absl::Mutex mutex_;
    absl::flat_hash_map<std::string, std::shared_ptr<Entry>> sessions_ ABSL_GUARDED_BY(mutex_);
};

} // namespace interview_coach
