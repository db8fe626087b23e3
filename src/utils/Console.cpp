#include "Console.h"
#include "Common.h"
#include <termios.h>
#include <unistd.h>

namespace DocsUpload {

    Console::Console(std::istream& in, std::ostream& out)
        : m_in(in), m_out(out) {}

    void Console::printMessages(const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            m_out << line << "\n";
        }
        m_out.flush();
    }

    std::string Console::readLine(const std::string& prompt) {
        m_out << prompt;
        m_out.flush();
        std::string line;
        if (!std::getline(m_in, line)) {
            throw DocsUploadException("Console input closed");
        }
        return line;
    }

    bool Console::disableEcho(int fd, termios& saved) {
        if (tcgetattr(fd, &saved) != 0) return false;
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        return tcsetattr(fd, TCSANOW, &silent) == 0;
    }

    std::string Console::readPassword(const std::string& prompt) {
        bool interactive = (&m_in == &std::cin) && isatty(STDIN_FILENO);
        termios original{};
        if (!interactive || !disableEcho(STDIN_FILENO, original)) {
            return readLine(prompt);
        }

        auto restoreEcho = [&original]() {
            if (tcsetattr(STDIN_FILENO, TCSANOW, &original) != 0) {
                std::cerr << "WARNING: could not restore terminal echo" << std::endl;
            }
        };

        std::string password;
        try {
            password = readLine(prompt);
        } catch (const DocsUploadException&) {
            restoreEcho();
            throw;
        }
        restoreEcho();
        m_out << std::endl;
        return password;
    }

} // namespace DocsUpload
