#pragma once

#include <string>
#include <filesystem>
#include "ArgParser.h"
#include "GoogleDriveClient.h"

namespace DocsUpload {

    /**
     * @brief Run configuration: built-in defaults, then the optional JSON
     * settings file, then command-line values.
     */
    struct Settings {
        std::string username;
        std::string password;
        std::string authSub;
        std::string remoteFolder;
        std::string protocol;
        std::string host;
        std::string authProtocol;
        std::string authHost;
        std::string clientId;
        std::string clientSecret;
        int uploadAttempts = 0;

        static Settings defaults();

        /**
         * @brief Loads @p file over the defaults. Unknown keys are ignored.
         * @throws DocsUploadException if the file is unreadable, is not a
         * JSON object, or holds a value of the wrong type.
         */
        static Settings loadFromFile(const std::filesystem::path& file);

        /**
         * @brief Overrides values with options given on the command line.
         */
        void applyArguments(const ArgParser::Arguments& args);

        DriveEndpoints endpoints() const;
    };

} // namespace DocsUpload
