#include "engine/curl_http_client.hpp"

#include <algorithm>
#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static TransportFailure classify(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
            return TransportFailure::ConnectionRefused;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFailure::HostNotFound;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportFailure::ConnectionReset;
        default:
            return TransportFailure::Other;
    }
}

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

std::expected<HttpResponse, TransportError> CurlHttpClient::perform(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(TransportError{TransportFailure::Other, "curl_easy_init failed"});
    }

    curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_mime* mime = nullptr;
    if (!request.form.empty()) {
        mime = curl_mime_init(curl);
        for (const auto& field : request.form) {
            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, field.name.c_str());
            curl_mime_data(part, field.data.data(), field.data.size());
            if (!field.filename.empty()) curl_mime_filename(part, field.filename.c_str());
            if (!field.content_type.empty()) curl_mime_type(part, field.content_type.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    HttpResponse response;
    long timeout = static_cast<long>(request.timeout.count());

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(timeout, 10L));

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    if (mime) curl_mime_free(mime);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(TransportError{classify(res), curl_easy_strerror(res)});
    }
    return response;
}
