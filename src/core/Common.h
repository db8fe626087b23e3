#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <iostream>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for Docs Upload.
 */
namespace DocsUpload {

    /**
     * @brief Line-oriented output sink used by the upload engine.
     */
    using LoggerCallback = std::function<void(const std::string&)>;

    /**
     * @brief Raised for conditions that end the whole run
     * (missing path, failed authentication, unusable configuration).
     */
    class DocsUploadException : public std::runtime_error {
    public:
        explicit DocsUploadException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    /**
     * @brief Sends a line to the logger, or to stdout when none is set.
     */
    inline void emitLine(const LoggerCallback& logger, const std::string& message) {
        if (logger) logger(message);
        else std::cout << message << std::endl;
    }

    /**
     * @brief Writes a fatal error line with the "ERROR: " prefix.
     */
    inline void reportError(std::ostream& out, const std::string& message) {
        out << "ERROR: " << message << std::endl;
    }

} // namespace DocsUpload
