#include "http_utils.hpp"
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl_handle) const { curl_easy_cleanup(curl_handle); }
};

struct CurlHeaderListDeleter {
    void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

size_t append_response_body(char* contents, size_t size, size_t nmemb, void* user_data) {
    static_cast<std::string*>(user_data)->append(contents, size * nmemb);
    return size * nmemb;
}

bool is_retryable_http_status(long http_status) {
    return http_status == 429 || http_status >= 500;
}

CurlHeaderList build_header_list(const std::vector<std::string>& headers) {
    curl_slist* header_list = nullptr;
    for (const std::string& header_line : headers) {
        curl_slist* extended_list = curl_slist_append(header_list, header_line.c_str());
        if (!extended_list) {
            curl_slist_free_all(header_list);
            throw std::runtime_error("Failed to build HTTP header list");
        }
        header_list = extended_list;
    }
    return CurlHeaderList(header_list);
}

} // anonymous namespace

void initialize_http_library() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (init_result != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(init_result));
        }
    });
}

std::string http_get(const HttpRequest& request) {
    if (request.attempts < 1) {
        throw std::runtime_error("HTTP GET needs at least one attempt");
    }

    CurlEasyHandle curl_handle(curl_easy_init());
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP GET request");
    }
    CurlHeaderList header_list = build_header_list(request.headers);

    std::string response_body;
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, append_response_body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, request.enable_ssl_verification ? 2L : 0L);

    std::string last_error_message;
    for (int attempt = 1; attempt <= request.attempts; ++attempt) {
        response_body.clear();
        long http_status = 0;
        CURLcode curl_result = curl_easy_perform(curl_handle.get());
        curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (curl_result == CURLE_OK && http_status < 400) {
            if (response_body.empty()) {
                throw std::runtime_error("HTTP GET returned an empty body (HTTP " + std::to_string(http_status) + ") for URL: " + request.url);
            }
            return response_body;
        }

        if (curl_result != CURLE_OK) {
            last_error_message = std::string(curl_easy_strerror(curl_result));
        } else {
            last_error_message = "HTTP " + std::to_string(http_status) + ": " + response_body.substr(0, 200);
            if (!is_retryable_http_status(http_status)) {
                break;
            }
        }

        if (attempt < request.attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>(request.retry_delay_ms) * attempt));
        }
    }

    throw std::runtime_error("HTTP GET failed: " + last_error_message + " URL: " + request.url);
}

std::string url_encode_query_value(const std::string& value) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string encoded_value;
    encoded_value.reserve(value.size());
    for (unsigned char value_character : value) {
        bool unreserved = (value_character >= 'A' && value_character <= 'Z') || (value_character >= 'a' && value_character <= 'z') ||
                          (value_character >= '0' && value_character <= '9') || value_character == '-' || value_character == '_' ||
                          value_character == '.' || value_character == '~';
        if (unreserved) {
            encoded_value += static_cast<char>(value_character);
            continue;
        }
        encoded_value += '%';
        encoded_value += hex_digits[value_character >> 4];
        encoded_value += hex_digits[value_character & 0x0F];
    }
    return encoded_value;
}

std::string replace_url_placeholder(const std::string& request_url, const std::string& symbol) {
    static const std::string placeholder = "{symbol}";
    std::string resolved_url = request_url;
    size_t placeholder_position = resolved_url.find(placeholder);
    if (placeholder_position != std::string::npos) {
        resolved_url.replace(placeholder_position, placeholder.size(), symbol);
    }
    return resolved_url;
}
