/**
 * session_store.cpp — Implementation
 *
 * Lock order: store mutex, then entry mutex. with_session() releases the
 * store mutex before taking the entry mutex.
 */

#include "session_store.hpp"

#include <vector>

namespace interview_coach {

SessionStore::SessionStore(SessionFactory factory)
    : factory_(std::move(factory))
{
}

std::shared_ptr<SessionStore::Entry> SessionStore::acquire(const std::string& session_id) {
    absl::MutexLock lock(&mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }

    auto entry = std::make_shared<Entry>();
    {
        absl::MutexLock entry_lock(&entry->mutex);
        entry->state = factory_(session_id);
    }
    sessions_.emplace(session_id, entry);
    return entry;
}

SessionState SessionStore::get(const std::string& session_id) {
    std::shared_ptr<Entry> entry = acquire(session_id);
    absl::MutexLock lock(&entry->mutex);
    return entry->state;
}

void SessionStore::update(const std::string& session_id, SessionState state) {
    std::shared_ptr<Entry> entry = acquire(session_id);
    absl::MutexLock lock(&entry->mutex);
    entry->state = std::move(state);
}

bool SessionStore::remove(const std::string& session_id) {
    absl::MutexLock lock(&mutex_);
    return sessions_.erase(session_id) > 0;
}

std::size_t SessionStore::remove_idle(int64_t now_ms, int64_t idle_timeout_ms) {
    absl::MutexLock lock(&mutex_);
    std::vector<std::string> idle;
    for (const auto& [id, entry] : sessions_) {
        absl::MutexLock entry_lock(&entry->mutex);
        if (now_ms - entry->state.last_tick_at_ms > idle_timeout_ms) {
            idle.push_back(id);
        }
    }
    for (const std::string& id : idle) {
        sessions_.erase(id);
    }
    return idle.size();
}

bool SessionStore::contains(const std::string& session_id) const {
    absl::MutexLock lock(&mutex_);
    return sessions_.contains(session_id);
}

std::size_t SessionStore::size() const {
    absl::MutexLock lock(&mutex_);
    return sessions_.size();
}

} // namespace interview_coach
