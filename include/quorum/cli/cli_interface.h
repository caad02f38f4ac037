// include/quorum/cli/cli_interface.h
#ifndef QUORUM_CLI_INTERFACE_H
#define QUORUM_CLI_INTERFACE_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>
#include <optional>

#include "quorum/config/engine_config.h"
#include "quorum/game/game_session.h"

namespace quorum {
namespace cli {

/**
 * @brief Interactive command-line front end
 *
 * Drives a GameSession from text commands. Input and output go through
 * replaceable callbacks.
 */
class CLIInterface {
public:
    explicit CLIInterface(const config::EngineConfig& config = config::EngineConfig());

    /**
     * @brief Run the CLI in interactive mode until quit or end of input
     *
     * @return Exit code
     */
    int run();

    /**
     * @brief Execute a single command
     *
     * @param command Command name, case-insensitive
     * @param args Arguments for the command
     * @return true if the command ran successfully, false if it failed or is unknown
     */
    bool executeCommand(const std::string& command, const std::vector<std::string>& args);

    bool hasCommand(const std::string& command) const;

    void setOutputCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Set input callback
     *
     * @param callback Returns the next line, or empty optional at end of input
     */
    void setInputCallback(std::function<std::optional<std::string>()> callback);

    const game::GameSession& getSession() const { return *session_; }

private:
    config::EngineConfig config_;
    std::unique_ptr<game::GameSession> session_;

    std::function<void(const std::string&)> outputCallback_;
    std::function<std::optional<std::string>()> inputCallback_;

    using CommandHandler = std::function<bool(const std::vector<std::string>&)>;
    std::map<std::string, CommandHandler> commands_;
    std::map<std::string, std::string> commandHelp_;

    void registerCommands();
    void output(const std::string& message);
    void reportResult();

    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdNew(const std::vector<std::string>& args);
    bool cmdPlay(const std::vector<std::string>& args);
    bool cmdPlace(const std::vector<std::string>& args);
    bool cmdMoves(const std::vector<std::string>& args);
    bool cmdShow(const std::vector<std::string>& args);
    bool cmdInfo(const std::vector<std::string>& args);
    bool cmdUndo(const std::vector<std::string>& args);
    bool cmdHistory(const std::vector<std::string>& args);
};

} // namespace cli
} // namespace quorum

#endif // QUORUM_CLI_INTERFACE_H
