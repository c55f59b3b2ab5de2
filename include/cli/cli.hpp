#ifndef DAGSYNC_CLI_HPP
#define DAGSYNC_CLI_HPP

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_config.hpp"

namespace dagsync {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(transfer::TransferConfig config, std::istream& in = std::cin,
                 std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line; false once the shell should exit
    bool execute(const std::string& line);


    // ---- GETTERS ----
    // Set when the last command was rejected or threw
    bool last_command_failed() const { return last_failed_; }

private:
    // Command arguments with --compress / --password pulled out
    struct Arguments {
        std::vector<std::string> positional;
        bool compress{false};
        std::optional<std::string> password;
    };

    // ---- PARAMETERS ----
    bool running_;
    bool last_failed_{false};
    transfer::TransferConfig config_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    // False for an unknown command or wrong argument count
    bool process_command(const std::string& command, const Arguments& args);
    void handle_upload_command(const Arguments& args);
    void handle_download_command(const Arguments& args);
    void handle_cat_command(const Arguments& args);
    void handle_stat_command(const Arguments& args);
    void handle_cid_command(const Arguments& args);
    void handle_help_command();
    // Prints progress until the channel reports a terminal event
    void follow_progress(transfer::ProgressChannel& channel);
    void log_and_display_error(const std::string& message, const std::string& error);

    static Arguments parse_arguments(std::istringstream& iss);
};

} // namespace cli
} // namespace dagsync

#endif // DAGSYNC_CLI_HPP
