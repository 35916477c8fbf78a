#ifndef TODO_HPP
#define TODO_HPP

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

using TodoId = std::uint64_t;

class Todo {
public:
    using time_point = std::chrono::system_clock::time_point;

    TodoId id = 0;
    std::string title;
    std::string description;
    bool completed = false;
    time_point created_at;
    time_point updated_at;
    time_point expires_at; // created_at + store ttl

    bool operator==(const Todo& other) const {
        return id == other.id
            && title == other.title
            && description == other.description
            && completed == other.completed
            && created_at == other.created_at
            && updated_at == other.updated_at
            && expires_at == other.expires_at;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "Todo {"
            << " Id: " << id
            << ", Title: " << title
            << ", Completed: " << std::boolalpha << completed
            << " }";
        return oss.str();
    }
};

#endif // TODO_HPP
