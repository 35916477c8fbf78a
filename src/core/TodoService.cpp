#include "TodoService.hpp"

#include <boost/beast/version.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "TodoErrors.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string API_TODOS_PATH = "/api/todos";
    const std::string API_STATS_PATH = "/api/stats";
    const std::string API_INFO_PATH = "/api/info";
    const std::string HEALTH_PATH = "/health";
    const std::string TOGGLE_ACTION = "toggle";

    struct EndpointInfo {
        const char* path;
        std::vector<std::string> methods;
    };

    // Reported by /api/info
    const std::vector<EndpointInfo> ENDPOINTS = {
        {"/api/todos", {"GET", "POST"}},
        {"/api/todos/<id>", {"GET", "PUT", "PATCH", "DELETE"}},
        {"/api/todos/<id>/toggle", {"PATCH"}},
        {"/api/stats", {"GET"}},
        {"/api/info", {"GET"}},
        {"/health", {"GET"}},
    };

    std::string_view stripQueryAndTrailingSlash(std::string_view target) {
        size_t query_pos = target.find('?');
        if (query_pos != std::string_view::npos) {
            target = target.substr(0, query_pos);
        }
        while (target.size() > 1 && target.back() == '/') {
            target.remove_suffix(1);
        }
        return target;
    }
}

void TodoService::processRequest(const Request& req, ResponseCallback send_response_cb) const {
    send_response_cb(handleRequest(req));
}

TodoService::Response TodoService::handleRequest(const Request& req) const {
    std::string_view path = stripQueryAndTrailingSlash(std::string_view(req.target().data(), req.target().size()));
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("TodoService::handleRequest " + std::string(req.method_string()) + " " + std::string(path));
    }

    try {
        return routeRequest(req, path);
    } catch (const ValidationError& e) {
        logger_->debug("Validation failed for " + std::string(path) + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::VALIDATION_ERROR);
        return makeErrorResponse(req, http::status::bad_request, e.what());
    } catch (const NotFoundError& e) {
        logger_->debug(e.what());
        return makeErrorResponse(req, http::status::not_found, "Todo not found");
    } catch (const json::parse_error& e) {
        logger_->warn("Request JSON parse error for " + std::string(path) + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::JSON_ERROR);
        return makeErrorResponse(req, http::status::bad_request, "Invalid JSON body");
    } catch (const json::exception& e) {
        logger_->warn("Request JSON error for " + std::string(path) + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::JSON_ERROR);
        return makeErrorResponse(req, http::status::bad_request, "Invalid JSON body");
    } catch (const std::exception& e) {
        logger_->error("Unexpected exception in handleRequest for " + std::string(path) + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        return makeErrorResponse(req, http::status::internal_server_error, "Internal Error");
    }
}

// --- Routing ---

TodoService::Response TodoService::routeRequest(const Request& req, std::string_view path) const {
    const auto method = req.method();

    if (path == API_TODOS_PATH) {
        if (method == http::verb::get) return handleListTodos(req);
        if (method == http::verb::post) return handleCreateTodo(req);
        return makeMethodNotAllowed(req, "GET, POST");
    }

    const std::string todos_prefix = API_TODOS_PATH + "/";
    if (path.size() > todos_prefix.size() && path.substr(0, todos_prefix.size()) == todos_prefix) {
        std::string_view rest = path.substr(todos_prefix.size());
        size_t slash_pos = rest.find('/');
        if (slash_pos == std::string_view::npos) {
            return routeTodoItem(req, rest, {});
        }
        return routeTodoItem(req, rest.substr(0, slash_pos), rest.substr(slash_pos + 1));
    }

    if (path == API_STATS_PATH) {
        if (method == http::verb::get) return handleStats(req);
        return makeMethodNotAllowed(req, "GET");
    }
    if (path == HEALTH_PATH) {
        if (method == http::verb::get) return handleHealth(req);
        return makeMethodNotAllowed(req, "GET");
    }
    if (path == API_INFO_PATH) {
        if (method == http::verb::get) return handleInfo(req);
        return makeMethodNotAllowed(req, "GET");
    }

    logger_->debug("TodoService - target not found: " + std::string(req.target()));
    return makeErrorResponse(req, http::status::not_found, "Resource not found");
}

TodoService::Response TodoService::routeTodoItem(
    const Request& req, std::string_view id_segment, std::string_view action) const {
    auto id = Utils::parseTodoId(id_segment);
    if (!id) {
        return makeErrorResponse(req, http::status::not_found, "Todo not found");
    }

    const auto method = req.method();
    if (action.empty()) {
        switch (method) {
            case http::verb::get: return handleGetTodo(req, *id);
            case http::verb::put: return handleUpdateTodo(req, *id);
            case http::verb::patch: return handleToggleTodo(req, *id);
            case http::verb::delete_: return handleDeleteTodo(req, *id);
            default: return makeMethodNotAllowed(req, "GET, PUT, PATCH, DELETE");
        }
    }
    if (action == TOGGLE_ACTION) {
        if (method == http::verb::patch) return handleToggleTodo(req, *id);
        return makeMethodNotAllowed(req, "PATCH");
    }
    return makeErrorResponse(req, http::status::not_found, "Resource not found");
}

// --- Handlers ---

TodoService::Response TodoService::handleListTodos(const Request& req) const {
    auto todos = store_->list();
    auto now = clock_->now();

    json body = json::array();
    for (const auto& todo : todos) {
        json todo_json;
        constructTodoJson(todo, now, todo_json);
        body.push_back(std::move(todo_json));
    }
    return makeJsonResponse(req, http::status::ok, body);
}

TodoService::Response TodoService::handleCreateTodo(const Request& req) const {
    json body = parseJsonObjectBody(req);

    if (!body.contains("title") || body["title"].is_null()) {
        throw ValidationError("Title is required");
    }
    if (!body["title"].is_string()) {
        throw ValidationError("Title must be a string");
    }
    std::string description;
    if (body.contains("description") && !body["description"].is_null()) {
        if (!body["description"].is_string()) {
            throw ValidationError("Description must be a string");
        }
        description = body["description"].get<std::string>();
    }

    Todo todo = store_->create(body["title"].get<std::string>(), description);
    statsd_client_->increment(MetricsDefinitions::TODO_CREATED);
    logger_->info("Created todo " + std::to_string(todo.id));

    json todo_json;
    constructTodoJson(todo, clock_->now(), todo_json);
    return makeJsonResponse(req, http::status::created, todo_json);
}

TodoService::Response TodoService::handleGetTodo(const Request& req, TodoId id) const {
    Todo todo = store_->get(id);
    json todo_json;
    constructTodoJson(todo, clock_->now(), todo_json);
    return makeJsonResponse(req, http::status::ok, todo_json);
}

TodoService::Response TodoService::handleUpdateTodo(const Request& req, TodoId id) const {
    json body = parseJsonObjectBody(req);

    TodoPatch patch;
    if (body.contains("title")) {
        if (!body["title"].is_string()) {
            throw ValidationError("Title must be a non-empty string");
        }
        patch.title = body["title"].get<std::string>();
    }
    if (body.contains("description")) {
        // null clears the description
        if (body["description"].is_null()) {
            patch.description = std::string();
        } else if (body["description"].is_string()) {
            patch.description = body["description"].get<std::string>();
        } else {
            throw ValidationError("Description must be a string or null");
        }
    }
    if (body.contains("completed")) {
        if (!body["completed"].is_boolean()) {
            throw ValidationError("Completed must be a boolean");
        }
        patch.completed = body["completed"].get<bool>();
    }

    Todo todo = store_->update(id, patch);
    logger_->debug("Updated todo " + std::to_string(id));

    json todo_json;
    constructTodoJson(todo, clock_->now(), todo_json);
    return makeJsonResponse(req, http::status::ok, todo_json);
}

TodoService::Response TodoService::handleToggleTodo(const Request& req, TodoId id) const {
    Todo todo = store_->toggle(id);
    logger_->debug("Todo " + std::to_string(id) + " marked as " + (todo.completed ? "completed" : "incomplete"));

    json todo_json;
    constructTodoJson(todo, clock_->now(), todo_json);
    return makeJsonResponse(req, http::status::ok, todo_json);
}

TodoService::Response TodoService::handleDeleteTodo(const Request& req, TodoId id) const {
    store_->remove(id);
    statsd_client_->increment(MetricsDefinitions::TODO_DELETED);
    logger_->info("Deleted todo " + std::to_string(id));

    json body = {
        {"message", "Todo deleted successfully"},
        {"id", id}
    };
    return makeJsonResponse(req, http::status::ok, body);
}

TodoService::Response TodoService::handleStats(const Request& req) const {
    TodoStats stats = store_->stats();
    json body = {
        {"total", stats.total},
        {"completed", stats.completed},
        {"pending", stats.pending}
    };
    return makeJsonResponse(req, http::status::ok, body);
}

TodoService::Response TodoService::handleHealth(const Request& req) const {
    json body = {
        {"status", "healthy"},
        {"application", config_.application_name},
        {"todos_in_memory", store_->size()},
        {"timestamp", Utils::formatIsoTimestamp(clock_->now())}
    };
    return makeJsonResponse(req, http::status::ok, body);
}

TodoService::Response TodoService::handleInfo(const Request& req) const {
    json endpoints = json::array();
    for (const auto& endpoint : ENDPOINTS) {
        endpoints.push_back({
            {"path", endpoint.path},
            {"methods", endpoint.methods}
        });
    }

    json body = {
        {"application", config_.application_name},
        {"version", Constants::APP_VERSION},
        {"data_retention_seconds", store_->ttl().count()},
        {"emissary_url", config_.emissary_url},
        {"endpoints", endpoints}
    };
    return makeJsonResponse(req, http::status::ok, body);
}

// --- Helpers ---

void TodoService::constructTodoJson(const Todo& todo, IClock::time_point now, json& todo_json) const {
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(todo.expires_at - now).count();

    todo_json["id"] = todo.id;
    todo_json["title"] = todo.title;
    todo_json["description"] = todo.description;
    todo_json["completed"] = todo.completed;
    todo_json["created_at"] = Utils::formatIsoTimestamp(todo.created_at);
    todo_json["updated_at"] = Utils::formatIsoTimestamp(todo.updated_at);
    todo_json["expires_at"] = Utils::formatIsoTimestamp(todo.expires_at);
    todo_json["time_remaining_seconds"] = std::max<long long>(0, remaining);
}

json TodoService::parseJsonObjectBody(const Request& req) const {
    if (Utils::trim(req.body()).empty()) {
        throw ValidationError("No JSON data provided");
    }
    json body = json::parse(req.body());
    if (!body.is_object() || body.empty()) {
        throw ValidationError("No JSON data provided");
    }
    return body;
}

TodoService::Response TodoService::makeJsonResponse(const Request& req, http::status status, const json& body) const {
    Response res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    // Request text may reach the body; never let invalid UTF-8 fail the response
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

TodoService::Response TodoService::makeErrorResponse(const Request& req, http::status status, const std::string& message) const {
    json body = {{"error", message}};
    return makeJsonResponse(req, status, body);
}

TodoService::Response TodoService::makeMethodNotAllowed(const Request& req, const std::string& allowed) const {
    Response res = makeErrorResponse(req, http::status::method_not_allowed, "Method not allowed");
    res.set(http::field::allow, allowed);
    return res;
}
