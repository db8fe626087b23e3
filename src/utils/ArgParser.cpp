#include "ArgParser.h"
#include "Definitions.h"
#include <iostream>
#include <sstream>

using namespace std;
namespace def = Definitions;

namespace {

const map<string, string> OPTION_ALIASES = {
    {"-rf", "--remote-folder"},
    {"-wf", "--without-folders"},
    {"-aa", "--add-all"},
    {"-sa", "--skip-all"},
    {"-ra", "--replace-all"},
    {"-dr", "--disable-retries"},
    {"-as", "--auth-sub"},
    {"-ap", "--auth-protocol"},
    {"-ah", "--auth-host"},
    {"-ro", "--mark-read-only"},
    {"--user", "--username"},
    {"--pass", "--password"},
    {"--auth", "--auth-sub"}
};

const vector<string> STRING_OPTIONS = {
    "username", "password", "auth-sub", "remote-folder", "auth-protocol",
    "auth-host", "protocol", "host", "config"
};

const vector<string> BOOL_OPTIONS = {
    "recursive", "without-folders", "add-all", "skip-all", "replace-all",
    "disable-retries", "mark-read-only"
};

} // namespace

ArgParser::ArgParser()
    : m_options(def::APP_NAME, "Batch upload of documents preserving folder structure.")
{
    m_options.add_options()
        ("path", "Local file or folder to upload", cxxopts::value<std::string>())
        ("u,username", "Username for a Google account", cxxopts::value<std::string>())
        ("p,password", "Password for a Google account", cxxopts::value<std::string>())
        ("auth-sub", "OAuth access token", cxxopts::value<std::string>())
        ("r,recursive", "Recursively upload all subfolders")
        ("remote-folder", "The remote folder path separated by '/'", cxxopts::value<std::string>())
        ("without-folders", "Do not recreate folder structure remotely")
        ("add-all", "Upload all documents even if documents with the same names exist")
        ("skip-all", "Skip all documents that already exist remotely")
        ("replace-all", "Replace all remote documents with the same names")
        ("disable-retries", "Disable auto-retries of failed uploads")
        ("mark-read-only", "Mark local folders read-only while they are uploaded")
        ("config", "JSON settings file", cxxopts::value<std::string>())
        ("auth-protocol", "The protocol to use with authentication", cxxopts::value<std::string>())
        ("auth-host", "The host of the auth server to use", cxxopts::value<std::string>())
        ("protocol", "The protocol to use with the HTTP requests", cxxopts::value<std::string>())
        ("s,host", "The API host", cxxopts::value<std::string>())
        ("h,help", "Display this help menu");
    m_options.parse_positional({"path"});
}

vector<string> ArgParser::normalizeAliases(int argc, char** argv) {
    vector<string> args;
    for (int i = 0; i < argc; ++i) {
        string arg = argv[i];
        auto alias = OPTION_ALIASES.find(arg);
        args.push_back(i > 0 && alias != OPTION_ALIASES.end() ? alias->second : arg);
    }
    return args;
}

string ArgParser::usage() {
    ostringstream out;
    for (const auto& line : def::USAGE_MESSAGE) {
        out << line << "\n";
    }
    out << "Supported file formats are: ";
    for (size_t i = 0; i < def::SUPPORTED_FORMATS.size(); ++i) {
        if (i > 0) out << ", ";
        out << def::SUPPORTED_FORMATS[i];
    }
    out << "\n";
    return out.str();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    vector<string> normalized = normalizeAliases(argc, argv);
    vector<char*> rawArgs;
    rawArgs.reserve(normalized.size());
    for (auto& arg : normalized) {
        rawArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    int count = static_cast<int>(rawArgs.size());
    char** values = rawArgs.data();

    try {
        auto result = m_options.parse(count, values);

        if (result.count("help")) {
            cout << usage() << endl;
            throw runtime_error("Help displayed.");
        }

        return mapResults(result);

    } catch (const cxxopts::OptionException& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw;
    }
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result) {
    Arguments args;
    if (result.count("path")) {
        args.path = result["path"].as<string>();
    }
    for (const auto& name : STRING_OPTIONS) {
        if (result.count(name)) {
            args.stringArgs[name] = result[name].as<string>();
        }
    }
    for (const auto& name : BOOL_OPTIONS) {
        args.boolArgs[name] = result.count(name) > 0;
    }
    return args;
}
