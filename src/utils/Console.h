#pragma once

#include <string>
#include <vector>
#include <iostream>
#include <termios.h>

namespace DocsUpload {

    /**
     * @brief Interactive prompts used before the upload starts.
     */
    class Console {
    public:
        Console(std::istream& in = std::cin, std::ostream& out = std::cout);

        void printMessages(const std::vector<std::string>& lines);

        /**
         * @brief Prints @p prompt and reads one line.
         * @throws DocsUploadException if input is closed.
         */
        std::string readLine(const std::string& prompt);

        /**
         * @brief Like readLine, with terminal echo disabled when reading
         * from an interactive stdin.
         */
        std::string readPassword(const std::string& prompt);

        /**
         * @brief Turns off echo on terminal @p fd and stores the previous
         * settings in @p saved.
         * @return false if @p fd is not a terminal or its settings could not
         * be read or changed; the terminal is then left untouched.
         */
        static bool disableEcho(int fd, termios& saved);

    private:
        std::istream& m_in;
        std::ostream& m_out;
    };

} // namespace DocsUpload
