#include "Settings.h"
#include "Definitions.h"
#include "Common.h"
#include <fstream>

namespace DocsUpload {

    namespace {

        void readString(const json& config, const std::string& key, std::string& target) {
            if (!config.contains(key)) return;
            if (!config[key].is_string()) {
                throw DocsUploadException("Setting '" + key + "' must be a string");
            }
            target = config[key].get<std::string>();
        }

        void applyString(const ArgParser::Arguments& args, const std::string& key, std::string& target) {
            auto it = args.stringArgs.find(key);
            if (it != args.stringArgs.end()) target = it->second;
        }

    } // namespace

    Settings Settings::defaults() {
        Settings settings;
        settings.protocol = Definitions::DEFAULT_PROTOCOL;
        settings.host = Definitions::DEFAULT_HOST;
        settings.authProtocol = Definitions::DEFAULT_AUTH_PROTOCOL;
        settings.authHost = Definitions::DEFAULT_AUTH_HOST;
        settings.uploadAttempts = Definitions::DEFAULT_UPLOAD_ATTEMPTS;
        return settings;
    }

    Settings Settings::loadFromFile(const std::filesystem::path& file) {
        std::ifstream in(file);
        if (!in) {
            throw DocsUploadException("Cannot open settings file " + file.string());
        }

        json config = json::parse(in, nullptr, false);
        if (config.is_discarded() || !config.is_object()) {
            throw DocsUploadException("Settings file " + file.string() + " is not a JSON object");
        }

        Settings settings = defaults();
        readString(config, "username", settings.username);
        readString(config, "auth_sub", settings.authSub);
        readString(config, "remote_folder", settings.remoteFolder);
        readString(config, "protocol", settings.protocol);
        readString(config, "host", settings.host);
        readString(config, "auth_protocol", settings.authProtocol);
        readString(config, "auth_host", settings.authHost);
        readString(config, "client_id", settings.clientId);
        readString(config, "client_secret", settings.clientSecret);

        if (config.contains("upload_attempts")) {
            if (!config["upload_attempts"].is_number_integer() || config["upload_attempts"].get<int>() < 1) {
                throw DocsUploadException("Setting 'upload_attempts' must be a positive integer");
            }
            settings.uploadAttempts = config["upload_attempts"].get<int>();
        }
        return settings;
    }

    void Settings::applyArguments(const ArgParser::Arguments& args) {
        applyString(args, "username", username);
        applyString(args, "password", password);
        applyString(args, "auth-sub", authSub);
        applyString(args, "remote-folder", remoteFolder);
        applyString(args, "protocol", protocol);
        applyString(args, "host", host);
        applyString(args, "auth-protocol", authProtocol);
        applyString(args, "auth-host", authHost);
    }

    DriveEndpoints Settings::endpoints() const {
        return DriveEndpoints{protocol, host, authProtocol, authHost, clientId, clientSecret};
    }

} // namespace DocsUpload
