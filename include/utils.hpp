#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"
#define COLOR_DEBUG "\033[36m"

namespace Rampart {

/**
 * @brief Enables or disables debug output for log_debug().
 */
void setVerbose(bool enabled);

/**
 * @brief Returns true when debug output is enabled.
 */
bool isVerbose();

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a debug message to standard error, only in verbose mode.
 *
 * @param message The message to log.
 */
inline void log_debug(const std::string &message)
{
    if (isVerbose()) {
        std::cerr << COLOR_DEBUG << "[DEBUG] " << COLOR_RESET << message << std::endl;
    }
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Downloads the body behind a URL.
 *
 * Uses libcurl to fetch the content at the specified URL and returns it as a string.
 * HTTP error statuses are treated as failures.
 *
 * @param url The URL to fetch.
 * @return A string containing the response body.
 * @throws std::runtime_error on transport or HTTP failure.
 */
std::string fetchUrl(const std::string& url);

/**
 * @brief Percent-encodes a string for use inside a URL query.
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Removes leading and trailing whitespace.
 */
std::string trim(const std::string& input);

/**
 * @brief Returns a lower-cased copy of the input.
 */
std::string toLower(const std::string& input);

/**
 * @brief Strips a version constraint from a dependency string.
 *
 * "foo>=1.2" becomes "foo", "bar=3" becomes "bar", "baz" is unchanged.
 */
std::string stripVersionConstraint(const std::string& dependency);

/**
 * @brief Joins strings with a separator.
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace Rampart

#endif // UTILS_HPP
