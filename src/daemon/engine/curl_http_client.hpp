#pragma once

#include "engine/http_client.hpp"

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::expected<HttpResponse, TransportError> perform(const HttpRequest& request) override;
};
