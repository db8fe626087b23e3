#include "ArgParser.h"
#include "Console.h"
#include "Definitions.h"
#include "GoogleDriveClient.h"
#include "Settings.h"
#include "Synchronizer.h"
#include <iostream>

using namespace DocsUpload;

namespace {

bool flag(const ArgParser::Arguments& args, const std::string& name) {
    auto it = args.boolArgs.find(name);
    return it != args.boolArgs.end() && it->second;
}

} // namespace

int main(int argc, char** argv) {
    ArgParser::Arguments args;
    try {
        ArgParser parser;
        args = parser.parseArgs(argc, argv);
    } catch (const std::exception&) {
        // help text or the parse error has already been printed
        return 1;
    }

    try {
        auto configFile = args.stringArgs.find("config");
        Settings settings = configFile != args.stringArgs.end()
                                ? Settings::loadFromFile(configFile->second)
                                : Settings::defaults();
        settings.applyArguments(args);

        Console console;
        console.printMessages(Definitions::WELCOME_MESSAGE);

        std::string path = args.path;
        bool hasCredentials = !settings.authSub.empty() || (!settings.username.empty() && !settings.password.empty());
        if (path.empty() || !hasCredentials) {
            if (settings.username.empty() && settings.authSub.empty()) {
                settings.username = console.readLine("Username: ");
            }
            if (settings.password.empty() && settings.authSub.empty()) {
                settings.password = console.readPassword("Password: ");
            }
        }

        GoogleDriveClient client(settings.endpoints());
        RemoteError authError = !settings.password.empty()
                                    ? client.authenticate(settings.username, settings.password)
                                    : client.authenticate(settings.authSub);
        if (authError.failed()) {
            reportError(std::cerr, "Authentication error: " + authError.message);
            return 1;
        }

        if (path.empty()) {
            path = console.readLine("Path: ");
        }

        UploadOptions options;
        options.recursive = flag(args, "recursive");
        options.remoteFolder = settings.remoteFolder;
        options.withoutFolders = flag(args, "without-folders");
        options.addAll = flag(args, "add-all");
        options.skipAll = flag(args, "skip-all");
        options.replaceAll = flag(args, "replace-all");
        options.disableRetries = flag(args, "disable-retries");
        options.markReadOnly = flag(args, "mark-read-only");
        options.uploadAttempts = settings.uploadAttempts;

        ConsoleDecisionProvider prompt;
        Synchronizer synchronizer(client, prompt);
        synchronizer.upload(path, options);

    } catch (const DocsUploadException& e) {
        reportError(std::cerr, e.what());
        return 1;
    } catch (const fs::filesystem_error& e) {
        reportError(std::cerr, e.what());
        return 1;
    }
    return 0;
}
