#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace Rampart {

namespace {

bool verboseEnabled = false;

} // namespace

void setVerbose(bool enabled)
{
    verboseEnabled = enabled;
}

bool isVerbose()
{
    return verboseEnabled;
}

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        std::cerr << "Error appending data to response: "
                  << e.what() << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

/**
 * @brief Fetches a URL using libcurl. Returns the response as a string.
 *        Throws on error.
 */
std::string fetchUrl(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "Rampart/0.1");

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        long responseCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);
        curl_easy_cleanup(curl);

        std::string message = "Failed to fetch " + url + ": " + curl_easy_strerror(res);
        if (responseCode >= 400) {
            message += " (HTTP " + std::to_string(responseCode) + ")";
        }
        throw std::runtime_error(message);
    }

    curl_easy_cleanup(curl);
    return response;
}

std::string urlEncode(const std::string& value)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        throw std::runtime_error("Failed to URL-encode '" + value + "'");
    }

    std::string result(escaped);
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

std::string trim(const std::string& input)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t first = input.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = input.find_last_not_of(whitespace);
    return input.substr(first, last - first + 1);
}

std::string toLower(const std::string& input)
{
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return result;
}

/**
 * @brief Cuts the dependency string at the first comparison operator.
 */
std::string stripVersionConstraint(const std::string& dependency)
{
    size_t pos = dependency.find_first_of("<>=");
    if (pos == std::string::npos) {
        return trim(dependency);
    }
    return trim(dependency.substr(0, pos));
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace Rampart
