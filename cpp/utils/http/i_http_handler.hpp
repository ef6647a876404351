#pragma once
#include <string>
#include <map>
#include <memory>

// HTTP request structure
struct HttpRequest {
    std::string method;           // GET, POST
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms{0};            // 0 uses the handler default
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;
    bool success{false};          // transport succeeded and status is 2xx
};

// Base interface for HTTP handlers
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    // Synchronous HTTP request
    virtual HttpResponse make_request(const HttpRequest& request) = 0;

    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
    virtual void set_default_headers(const std::map<std::string, std::string>& headers) = 0;
};

// HTTP handler factory; the rollup service uses it unless a handler is injected
class HttpHandlerFactory {
public:
    enum class Type {
        CURL
    };

    static std::unique_ptr<IHttpHandler> create(Type type = Type::CURL);
};
