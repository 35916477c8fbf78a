#ifndef TODOERRORS_HPP
#define TODOERRORS_HPP

#include <stdexcept>
#include <string>

#include "../models/Todo.hpp"

// Base for the per-request failures TodoStore reports.
class TodoError : public std::runtime_error {
public:
    explicit TodoError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or invalid input. Mapped to HTTP 400.
class ValidationError : public TodoError {
public:
    explicit ValidationError(const std::string& message) : TodoError(message) {}
};

// Unknown, deleted or expired todo id. Mapped to HTTP 404.
class NotFoundError : public TodoError {
public:
    explicit NotFoundError(TodoId id)
        : TodoError("Todo not found: " + std::to_string(id)), id_(id) {}

    TodoId id() const { return id_; }

private:
    TodoId id_;
};

#endif // TODOERRORS_HPP
