#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

struct FormField {
    std::string name;
    std::string data;
    std::string filename;      // set for file parts
    std::string content_type;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;                   // ignored when form is non-empty
    std::vector<FormField> form;        // multipart/form-data
    std::chrono::seconds timeout{10};
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

enum class TransportFailure { ConnectionRefused, HostNotFound, Timeout, ConnectionReset, Other };

struct TransportError {
    TransportFailure kind = TransportFailure::Other;
    std::string message;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // An HTTP error status is a successful transport result; only failures to
    // get any response at all are reported as TransportError.
    virtual std::expected<HttpResponse, TransportError> perform(const HttpRequest& request) = 0;
};
