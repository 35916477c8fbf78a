#ifndef TODOPATCH_HPP
#define TODOPATCH_HPP

#include <optional>
#include <string>

// Partial update for a Todo. An empty optional means "not supplied".
// A cleared description is represented as a supplied empty string.
struct TodoPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<bool> completed;

    bool empty() const {
        return !title && !description && !completed;
    }
};

#endif // TODOPATCH_HPP
