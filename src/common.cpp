#include "common.hpp"

#include <cctype>
#include <stdexcept>

namespace toolwire {

std::vector<std::string> split_command(const std::string & command) {
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;

    size_t i = 0;
    const size_t n = command.size();
    while (i < n) {
        const char c = command[i];

        if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                args.push_back(current);
                current.clear();
                in_token = false;
            }
            ++i;
        } else if (c == '\'') {
            const size_t end = command.find('\'', i + 1);
            if (end == std::string::npos) {
                throw std::invalid_argument("Unterminated single quote in command: " + command);
            }
            current.append(command, i + 1, end - i - 1);
            in_token = true;
            i = end + 1;
        } else if (c == '"') {
            ++i;
            bool closed = false;
            while (i < n) {
                const char d = command[i];
                if (d == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (d == '\\' && i + 1 < n) {
                    const char e = command[i + 1];
                    if (e == '"' || e == '\\' || e == '$' || e == '`') {
                        current += e;
                        i += 2;
                        continue;
                    }
                    if (e == '\n') {
                        i += 2;
                        continue;
                    }
                }
                current += d;
                ++i;
            }
            if (!closed) {
                throw std::invalid_argument("Unterminated double quote in command: " + command);
            }
            in_token = true;
        } else if (c == '\\') {
            if (i + 1 >= n) {
                throw std::invalid_argument("Trailing backslash in command: " + command);
            }
            if (command[i + 1] != '\n') {
                current += command[i + 1];
                in_token = true;
            }
            i += 2;
        } else {
            current += c;
            in_token = true;
            ++i;
        }
    }

    if (in_token) {
        args.push_back(current);
    }

    return args;
}

std::string sanitize_name(const std::string & name) {
    std::string result = name;
    for (auto & c : result) {
        if (!std::isalnum((unsigned char) c) && c != '_') {
            c = '_';
        }
    }
    return result;
}

} // namespace toolwire
