#ifndef TODOSTORE_HPP
#define TODOSTORE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../interfaces/IClock.hpp"
#include "../interfaces/TodoStoreInterface.hpp"

// In-memory todo store. Every todo expires ttl after creation: it is expired
// once now >= created_at + ttl and is purged the first time any operation
// observes it in that state. All operations hold a single mutex.
class TodoStore : public TodoStoreInterface {
private:
    std::map<TodoId, Todo> todos_; // Ordered by id, which is also creation order
    TodoId last_id_ = 0;           // Never reused
    std::size_t unreported_expired_ = 0; // Purged since the last purgeExpired()

    mutable std::mutex mutex_;
    std::shared_ptr<IClock> clock_;
    const std::chrono::seconds ttl_;

    // Callers must hold mutex_
    bool isExpired(const Todo& todo, IClock::time_point now) const;
    void removeExpired(IClock::time_point now);
    Todo& findLive(TodoId id, IClock::time_point now);
    void touch(Todo& todo, IClock::time_point now) const;

public:
    static constexpr std::chrono::seconds DEFAULT_TTL{300};

    explicit TodoStore(std::shared_ptr<IClock> clock, std::chrono::seconds ttl = DEFAULT_TTL);

    ~TodoStore() override = default;

    TodoStore(const TodoStore&) = delete;
    TodoStore& operator=(const TodoStore&) = delete;

    Todo create(const std::string& title, const std::string& description) override;
    Todo get(TodoId id) override;
    std::vector<Todo> list() override;
    Todo update(TodoId id, const TodoPatch& patch) override;
    Todo toggle(TodoId id) override;
    void remove(TodoId id) override;
    TodoStats stats() override;
    std::size_t purgeExpired() override;
    std::size_t size() const override;
    std::chrono::seconds ttl() const override { return ttl_; }
};

#endif // TODOSTORE_HPP
