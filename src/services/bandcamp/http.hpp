#pragma once

#include <string>
#include <vector>

namespace camper::bandcamp {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::vector<std::string> headers;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Seam between the content client and libcurl.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws NetworkError when no response could be obtained. Any HTTP
    // status, including errors, is returned to the caller.
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlTransport : public HttpTransport {
public:
    CurlTransport(std::string user_agent, long timeout_seconds);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

    static std::string url_encode(const std::string& value);

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string user_agent;
    long timeout_seconds;
};

} // namespace camper::bandcamp
