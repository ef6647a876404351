#include "curl_http_handler.hpp"
#include <stdexcept>
#include <string>

CurlHttpHandler::CurlHttpHandler() {
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpHandler::~CurlHttpHandler() {
    shutdown();
}

bool CurlHttpHandler::initialize() {
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return false;
        }
    }
    initialized_ = true;
    return true;
}

void CurlHttpHandler::shutdown() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    initialized_ = false;
}

HttpResponse CurlHttpHandler::make_request(const HttpRequest& request) {
    HttpResponse response;
    if (!initialized_) {
        response.error_message = "HTTP handler not initialized";
        return response;
    }

    WriteCallbackData data;
    data.buffer = &response.body;
    data.response = &response;

    // Reset CURL handle
    curl_easy_reset(curl_);
    setup_curl_options(request, data);

    curl_slist* header_list = build_header_list(request);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);
    response.success = (response_code >= 200 && response_code < 300);

    return response;
}

void CurlHttpHandler::setup_curl_options(const HttpRequest& request, WriteCallbackData& data) {
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "offchain-matcher/1.0");

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    long timeout = request.timeout_ms > 0 ? request.timeout_ms : default_timeout_ms_;
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout);

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &data);

    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &data);
}

curl_slist* CurlHttpHandler::build_header_list(const HttpRequest& request) const {
    curl_slist* header_list = nullptr;
    for (const auto* headers : {&default_headers_, &request.headers}) {
        for (const auto& [key, value] : *headers) {
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }
    }
    return header_list;
}

size_t CurlHttpHandler::WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->buffer) return 0;

    size_t total_size = size * nmemb;
    data->buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpHandler::HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->response) return 0;

    size_t total_size = size * nmemb;
    std::string header_line(static_cast<char*>(contents), total_size);

    while (!header_line.empty() && (header_line.back() == '\n' || header_line.back() == '\r')) {
        header_line.pop_back();
    }

    // "Key: Value"
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        data->response->headers[key] = value;
    }

    return total_size;
}

std::unique_ptr<IHttpHandler> HttpHandlerFactory::create(HttpHandlerFactory::Type type) {
    switch (type) {
        case HttpHandlerFactory::Type::CURL:
            return std::make_unique<CurlHttpHandler>();
        default:
            throw std::runtime_error("Unknown HTTP handler type");
    }
}
