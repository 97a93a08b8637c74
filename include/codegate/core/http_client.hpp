/*
 * codegate - HTTP Client
 *
 * Thin blocking wrapper around libcurl easy handles.
 * curl_global_init() must have been called by the application.
 */
#ifndef codegate_CORE_HTTP_CLIENT_HPP
#define codegate_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>

namespace codegate {

struct HttpResponse {
    int status_code;        // 0 if the request never got an HTTP response
    std::string body;
    std::string error;      // transport error (curl) when status_code == 0

    HttpResponse() : status_code(0) {}
};

class HttpClient {
public:
    HttpClient();

    // Total request budget in seconds (0 = no limit)
    void set_timeout(long seconds) { timeout_secs_ = seconds; }
    void set_connect_timeout(long seconds) { connect_timeout_secs_ = seconds; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);

private:
    long timeout_secs_;
    long connect_timeout_secs_;
};

} // namespace codegate

#endif // codegate_CORE_HTTP_CLIENT_HPP
