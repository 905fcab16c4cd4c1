#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include "config/config.hpp"
#include "network/engine.hpp"

namespace ghostnet {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Registers engine callbacks that print incoming events to `output`
    CLI(network::Engine& engine, config::Config& config,
        std::istream& input = std::cin, std::ostream& output = std::cout);
    // Detaches the callbacks from the engine
    ~CLI();


    // ---- STARTUP ----
    void run();
    // Executes a single command line; returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    network::Engine& engine_;
    config::Config& config_;
    std::istream& input_;
    std::ostream& output_;
    // Callbacks print from worker threads
    std::mutex output_mutex_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, std::istringstream& args);
    void handle_peers_command();
    void handle_known_command();
    void handle_send_command(std::istringstream& args);
    void handle_sendfile_command(std::istringstream& args);
    void handle_history_command(std::istringstream& args);
    void handle_export_command(std::istringstream& args);
    void handle_cleanup_command();
    void handle_stats_command();
    void handle_status_command();
    void handle_name_command(std::istringstream& args);
    void handle_help_command();
    void print(const std::string& text);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace ghostnet
