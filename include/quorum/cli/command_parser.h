// include/quorum/cli/command_parser.h
#ifndef QUORUM_COMMAND_PARSER_H
#define QUORUM_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <map>

namespace quorum {
namespace cli {

/**
 * @brief Command parser for the CLI
 *
 * This class provides utilities for parsing command-line input
 * and program arguments.
 */
class CommandParser {
public:
    /**
     * @brief Split a command line into tokens
     *
     * Double-quoted text is kept as one token.
     *
     * @param line The input line to tokenize
     * @return Vector of tokens
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief Extract flags from arguments
     *
     * Accepts "--flag value", "--flag=value" and bare "--flag". Extracted
     * flags and their values are removed from args.
     *
     * @param args Vector of arguments
     * @param flagPrefix Prefix for flags (e.g., "--" or "-")
     * @return Map of flags to values (empty string for boolean flags)
     */
    static std::map<std::string, std::string> extractFlags(
        std::vector<std::string>& args, const std::string& flagPrefix = "--");

    static bool hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag);

    /**
     * @brief Get flag value as string
     *
     * @param flags Map of flags
     * @param flag Flag to get
     * @param defaultValue Default value if flag is not present
     * @return Flag value or default value
     */
    static std::string getFlagValue(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        const std::string& defaultValue = "");
};

} // namespace cli
} // namespace quorum

#endif // QUORUM_COMMAND_PARSER_H
