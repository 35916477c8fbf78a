#ifndef TODOSTOREINTERFACE_HPP
#define TODOSTOREINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "../models/Todo.hpp"
#include "../models/TodoPatch.hpp"
#include "../models/TodoStats.hpp"

// Operations that look up a single id throw NotFoundError when the id is
// unknown, deleted or expired. create/update throw ValidationError on an
// empty title.
class TodoStoreInterface {
public:
    virtual ~TodoStoreInterface() = default;
    virtual Todo create(const std::string& title, const std::string& description) = 0;
    virtual Todo get(TodoId id) = 0;
    virtual std::vector<Todo> list() = 0;
    virtual Todo update(TodoId id, const TodoPatch& patch) = 0;
    virtual Todo toggle(TodoId id) = 0;
    virtual void remove(TodoId id) = 0;
    virtual TodoStats stats() = 0;
    // Purges every expired todo. Returns how many expired since the previous
    // call, counting those already purged on access.
    virtual std::size_t purgeExpired() = 0;
    virtual std::size_t size() const = 0;
    virtual std::chrono::seconds ttl() const = 0;
};

#endif // TODOSTOREINTERFACE_HPP
