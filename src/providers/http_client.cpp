#include "providers/http_client.h"
#include "providers/protocol.h"
#include "logger.h"
#include <curl/curl.h>
#include <chrono>
#include <sstream>

namespace luna_voice {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancellationToken* token = static_cast<const CancellationToken*>(clientp);
    return token->is_cancelled() ? 1 : 0;  // non-zero aborts the transfer
}

Error map_curl_error(CURLcode code, const char* detail) {
    std::string message = std::string(curl_easy_strerror(code));
    if (detail && detail[0] != '\0') {
        message += ": " + std::string(detail);
    }
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_timeout_error("request timed out: " + message);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_cancelled_error("request aborted");
        default:
            return make_network_error("network request failed: " + message);
    }
}

} // namespace

HttpClient::HttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

Result<HttpResponse> HttpClient::post(const HttpRequest& request, const CancellationToken& token) {
    if (token.is_cancelled()) {
        return make_cancelled_error("request not started");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_mime* mime = nullptr;
    if (!request.parts.empty()) {
        mime = curl_mime_init(curl);
        for (const auto& part : request.parts) {
            curl_mimepart* field = curl_mime_addpart(mime);
            curl_mime_name(field, part.name.c_str());
            curl_mime_data(field, part.data.data(), part.data.size());
            if (!part.filename.empty()) curl_mime_filename(field, part.filename.c_str());
            if (!part.content_type.empty()) curl_mime_type(field, part.content_type.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    std::string response_buffer;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);

    auto start = std::chrono::steady_clock::now();
    LOG_NET("POST " + request.url);
    CURLcode res = curl_easy_perform(curl);

    HttpResponse response;
    char* content_type = nullptr;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type) response.content_type = content_type;
    }

    curl_slist_free_all(headers);
    if (mime) curl_mime_free(mime);
    curl_easy_cleanup(curl);

    std::ostringstream oss;
    oss << "POST " << request.url << " -> curl=" << res << " status=" << response.status
        << " bytes=" << response_buffer.size() << " in "
        << ms_between(start, std::chrono::steady_clock::now()) << "ms";
    LOG_NET(oss.str());

    if (res != CURLE_OK) {
        return map_curl_error(res, error_buffer);
    }
    if (response.status >= 400) {
        return protocol::error_for_http_status(response.status, response_buffer);
    }
    response.body = std::move(response_buffer);
    return response;
}

} // namespace luna_voice
