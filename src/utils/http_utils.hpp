#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;    // "Name: value"
    int attempts;
    int timeout_seconds;
    bool enable_ssl_verification;
    int retry_delay_ms;                  // Grows linearly with the attempt number

    explicit HttpRequest(const std::string& request_url)
        : url(request_url), headers(), attempts(3), timeout_seconds(30), enable_ssl_verification(true), retry_delay_ms(250) {}
};

// curl_global_init once per process; call before any worker thread issues requests
void initialize_http_library();

// GET with retries on transport errors, HTTP 429 and 5xx. Throws std::runtime_error on final failure
// or on an empty body.
std::string http_get(const HttpRequest& request);

// Percent-encodes a query parameter value
std::string url_encode_query_value(const std::string& value);

// Substitutes the first "{symbol}" in an endpoint template
std::string replace_url_placeholder(const std::string& request_url, const std::string& symbol);

#endif // HTTP_UTILS_HPP
