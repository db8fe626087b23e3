#ifndef ARG_PARSER_H
#define ARG_PARSER_H

#include <string>
#include <vector>
#include <map>
#include "cxxopts.hpp" // Requires cxxopts dependency

/**
 * @brief Utility class to parse command line arguments using cxxopts.
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     * Only options present on the command line appear in stringArgs.
     */
    struct Arguments {
        std::string path;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, bool> boolArgs;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @throws std::runtime_error after printing the usage text for --help.
     * @throws cxxopts::OptionException for malformed options.
     */
    Arguments parseArgs(int argc, char** argv);

    /**
     * @brief Rewrites the multi-letter short aliases (-rf, -wf, -aa, ...)
     * and legacy long names (--user, --pass, --auth) to canonical options.
     */
    static std::vector<std::string> normalizeAliases(int argc, char** argv);

    static std::string usage();

private:
    cxxopts::Options m_options;

    Arguments mapResults(const cxxopts::ParseResult& result);
};

#endif // ARG_PARSER_H
