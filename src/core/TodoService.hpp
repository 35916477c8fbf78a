#ifndef TODOSERVICE_HPP
#define TODOSERVICE_HPP

#include <boost/beast/http.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/TodoStoreInterface.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// Translates HTTP requests into TodoStore operations and JSON responses.
class TodoService {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using ResponseCallback = std::function<void(std::optional<Response>)>;

    TodoService(std::shared_ptr<TodoStoreInterface> store,
                std::shared_ptr<IClock> clock,
                std::shared_ptr<IStatsDClient> statsd_client,
                const AppConfig& config,
                std::shared_ptr<ILogger> logger)
        : store_(store),
        clock_(clock),
        statsd_client_(statsd_client),
        config_(config),
        logger_(logger) {
        if (!store_) {
            throw std::invalid_argument("Store pointer cannot be null");
        }
        if (!clock_) {
            throw std::invalid_argument("Clock pointer cannot be null");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient pointer cannot be null");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        logger_->debug("TodoService initialized");
    }

    virtual ~TodoService() = default;

    TodoService(const TodoService&) = delete;
    TodoService& operator=(const TodoService&) = delete;
    TodoService(TodoService&&) = delete;
    TodoService& operator=(TodoService&&) = delete;

    // Called by HttpServerSession. The callback runs before this returns.
    void processRequest(const Request& req, ResponseCallback send_response_cb) const;

    // Routes a single request and always produces a response.
    Response handleRequest(const Request& req) const;

    void constructTodoJson(const Todo& todo, IClock::time_point now, json& todo_json) const;

private:
    std::shared_ptr<TodoStoreInterface> store_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;

    Response routeRequest(const Request& req, std::string_view path) const;
    Response routeTodoItem(const Request& req, std::string_view id_segment, std::string_view action) const;

    Response handleListTodos(const Request& req) const;
    Response handleCreateTodo(const Request& req) const;
    Response handleGetTodo(const Request& req, TodoId id) const;
    Response handleUpdateTodo(const Request& req, TodoId id) const;
    Response handleToggleTodo(const Request& req, TodoId id) const;
    Response handleDeleteTodo(const Request& req, TodoId id) const;
    Response handleStats(const Request& req) const;
    Response handleHealth(const Request& req) const;
    Response handleInfo(const Request& req) const;

    json parseJsonObjectBody(const Request& req) const;
    Response makeJsonResponse(const Request& req, http::status status, const json& body) const;
    Response makeErrorResponse(const Request& req, http::status status, const std::string& message) const;
    Response makeMethodNotAllowed(const Request& req, const std::string& allowed) const;
};

#endif // TODOSERVICE_HPP
