#include "TodoStore.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "../core/TodoErrors.hpp"
#include "../utils/Utils.hpp"

using namespace std::chrono;

TodoStore::TodoStore(std::shared_ptr<IClock> clock, seconds ttl)
    : clock_(std::move(clock)), ttl_(ttl) {
    if (!clock_) {
        throw std::invalid_argument("Clock pointer cannot be null");
    }
    if (ttl_ <= seconds::zero()) {
        throw std::invalid_argument("Todo ttl must be positive");
    }
}

Todo TodoStore::create(const std::string& title, const std::string& description) {
    std::string trimmed_title = Utils::trim(title);
    if (trimmed_title.empty()) {
        throw ValidationError("Title is required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    Todo todo;
    todo.id = ++last_id_;
    todo.title = std::move(trimmed_title);
    todo.description = Utils::trim(description);
    todo.completed = false;
    todo.created_at = now;
    todo.updated_at = now;
    todo.expires_at = now + ttl_;

    todos_.emplace(todo.id, todo);
    return todo;
}

Todo TodoStore::get(TodoId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLive(id, clock_->now());
}

std::vector<Todo> TodoStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    removeExpired(clock_->now());

    std::vector<Todo> result;
    result.reserve(todos_.size());
    for (const auto& [id, todo] : todos_) {
        result.push_back(todo);
    }
    return result;
}

Todo TodoStore::update(TodoId id, const TodoPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    Todo& todo = findLive(id, now);

    // Validate before touching the record so a rejected patch changes nothing
    std::optional<std::string> new_title;
    if (patch.title) {
        new_title = Utils::trim(*patch.title);
        if (new_title->empty()) {
            throw ValidationError("Title cannot be empty");
        }
    }

    if (new_title) {
        todo.title = std::move(*new_title);
    }
    if (patch.description) {
        todo.description = Utils::trim(*patch.description);
    }
    if (patch.completed) {
        todo.completed = *patch.completed;
    }
    touch(todo, now);
    return todo;
}

Todo TodoStore::toggle(TodoId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    Todo& todo = findLive(id, now);
    todo.completed = !todo.completed;
    touch(todo, now);
    return todo;
}

void TodoStore::remove(TodoId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    findLive(id, clock_->now());
    todos_.erase(id);
}

TodoStats TodoStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    removeExpired(clock_->now());

    TodoStats stats;
    stats.total = todos_.size();
    for (const auto& [id, todo] : todos_) {
        if (todo.completed) {
            ++stats.completed;
        }
    }
    stats.pending = stats.total - stats.completed;
    return stats;
}

// Includes todos already purged by other operations since the previous call
std::size_t TodoStore::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    removeExpired(clock_->now());
    return std::exchange(unreported_expired_, 0);
}

std::size_t TodoStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return todos_.size();
}

// --- Private helpers, mutex_ already held ---

bool TodoStore::isExpired(const Todo& todo, IClock::time_point now) const {
    return now >= todo.created_at + ttl_;
}

void TodoStore::removeExpired(IClock::time_point now) {
    for (auto it = todos_.begin(); it != todos_.end(); ) {
        if (isExpired(it->second, now)) {
            it = todos_.erase(it);
            ++unreported_expired_;
        } else {
            ++it;
        }
    }
}

Todo& TodoStore::findLive(TodoId id, IClock::time_point now) {
    auto it = todos_.find(id);
    if (it == todos_.end()) {
        throw NotFoundError(id);
    }
    if (isExpired(it->second, now)) {
        todos_.erase(it);
        ++unreported_expired_;
        throw NotFoundError(id);
    }
    return it->second;
}

// updated_at must move forward on every mutation, even if the clock has not
void TodoStore::touch(Todo& todo, IClock::time_point now) const {
    if (now > todo.updated_at) {
        todo.updated_at = now;
    } else {
        todo.updated_at += microseconds(1);
    }
}
