// src/cli/command_parser.cpp
#include "quorum/cli/command_parser.h"
#include <sstream>

namespace quorum {
namespace cli {

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;

    bool inQuotes = false;
    std::string quotedToken;

    while (iss >> token) {
        if (!inQuotes) {
            if (token.size() > 0 && token[0] == '"') {
                if (token.size() > 1 && token.back() == '"') {
                    tokens.push_back(token.substr(1, token.size() - 2));
                } else {
                    inQuotes = true;
                    quotedToken = token.substr(1);
                }
            } else {
                tokens.push_back(token);
            }
        } else if (token.back() == '"') {
            quotedToken += " " + token.substr(0, token.size() - 1);
            tokens.push_back(quotedToken);
            inQuotes = false;
            quotedToken.clear();
        } else {
            quotedToken += " " + token;
        }
    }

    // Unclosed quote runs to the end of the line
    if (inQuotes) {
        tokens.push_back(quotedToken);
    }

    return tokens;
}

std::map<std::string, std::string> CommandParser::extractFlags(
    std::vector<std::string>& args, const std::string& flagPrefix) {

    std::map<std::string, std::string> flags;
    auto it = args.begin();

    while (it != args.end()) {
        const std::string arg = *it;

        if (arg.size() <= flagPrefix.size() || arg.compare(0, flagPrefix.size(), flagPrefix) != 0) {
            ++it;
            continue;
        }

        std::string flag = arg.substr(flagPrefix.size());
        std::string value;
        it = args.erase(it);

        size_t equalPos = flag.find('=');
        if (equalPos != std::string::npos) {
            value = flag.substr(equalPos + 1);
            flag = flag.substr(0, equalPos);
        } else if (it != args.end() && !it->empty() && (*it)[0] != '-') {
            value = *it;
            it = args.erase(it);
        }

        flags[flag] = value;
    }

    return flags;
}

bool CommandParser::hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag) {
    return flags.find(flag) != flags.end();
}

std::string CommandParser::getFlagValue(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    const std::string& defaultValue) {

    auto it = flags.find(flag);
    if (it != flags.end()) {
        return it->second;
    }

    return defaultValue;
}

} // namespace cli
} // namespace quorum
