/**
 * @file http_transport.hpp
 * @brief Minimal HTTP seam between the gateway and the mapping provider.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace commute {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Raised when a request cannot be completed at all (DNS, connect,
 * timeout).
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @throws TransportError if no response was received
     */
    virtual HttpResponse get(const std::string& url,
                             const std::vector<std::string>& headers) = 0;

    /**
     * @brief POST a JSON body.
     * @throws TransportError if no response was received
     */
    virtual HttpResponse post_json(const std::string& url, const std::string& body,
                                   const std::vector<std::string>& headers) = 0;
};

/**
 * @brief libcurl implementation. One easy handle per request.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_ms = 8000);

    HttpResponse get(const std::string& url,
                     const std::vector<std::string>& headers) override;

    HttpResponse post_json(const std::string& url, const std::string& body,
                           const std::vector<std::string>& headers) override;

private:
    HttpResponse perform(const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers);

    long timeout_ms_;
};

/**
 * @brief Percent-encode a query string component.
 */
std::string url_encode(const std::string& value);

}  // namespace commute
