/*
 * codegate - HTTP Client Implementation (libcurl)
 */
#include <codegate/core/http_client.hpp>
#include <codegate/core/logger.hpp>

#include <curl/curl.h>

namespace codegate {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

HttpClient::HttpClient()
    : timeout_secs_(120)
    , connect_timeout_secs_(15)
{}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_secs_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_secs_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    LOG_DEBUG("[HttpClient] POST %s (%zu bytes)", url.c_str(), body.size());

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        response.status_code = 0;
    } else {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return response;
}

} // namespace codegate
