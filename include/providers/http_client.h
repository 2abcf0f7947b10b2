#pragma once

#include "common.h"
#include "cancellation.h"
#include "errors.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace luna_voice {

/**
 * @brief One part of a multipart/form-data body
 */
struct MultipartPart {
    std::string name;
    std::string data;
    std::string filename;       ///< Non-empty makes this a file part
    std::string content_type;
};

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   ///< "Name: value" lines
    std::string body;                   ///< Sent as POST body when parts is empty
    std::vector<MultipartPart> parts;
    int timeout_ms = 15000;
    int connect_timeout_ms = 3000;
};

struct HttpResponse {
    long status = 0;
    std::string content_type;
    std::string body;
};

/**
 * @brief Minimal blocking HTTP POST client on libcurl
 *
 * Transfers abort as soon as the cancellation token fires. Transport
 * failures map to NetworkError, transfer timeouts to Timeout, and any
 * status >= 400 through protocol::error_for_http_status.
 *
 * Thread Safety:
 * - post() may be called concurrently; each call uses its own easy handle
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> post(const HttpRequest& request, const CancellationToken& token);
};

} // namespace luna_voice
