#include "cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <iomanip>

namespace ghostnet {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(network::Engine& engine, config::Config& config, std::istream& input, std::ostream& output)
  : running_(false)
  , engine_(engine)
  , config_(config)
  , input_(input)
  , output_(output) {
  engine_.on_peer_list_changed([this](const std::vector<network::Peer>& peers) {
    print("[peers] " + std::to_string(peers.size()) + " online");
  });
  engine_.on_message_received([this](const std::string& peer_ip, const std::string& text, const std::string&) {
    const std::string name = engine_.peer_username(peer_ip).value_or(peer_ip);
    print("[" + name + "] " + text);
  });
  engine_.on_file_received([this](const std::string& peer_ip, const std::string& filename,
                                  const std::filesystem::path& path, const std::string&) {
    const std::string name = engine_.peer_username(peer_ip).value_or(peer_ip);
    print("[" + name + "] sent file " + filename + " -> " + path.string());
  });
  engine_.on_status_changed([this](const std::string& status) {
    print("[status] " + status);
  });

  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}

CLI::~CLI() {
  engine_.on_peer_list_changed(nullptr);
  engine_.on_message_received(nullptr);
  engine_.on_file_received(nullptr);
  engine_.on_status_changed(nullptr);
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  output_ << "ghostnet> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      std::lock_guard<std::mutex> lock(output_mutex_);
      output_ << "ghostnet> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream args(line);
  std::string command;
  if (!(args >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, std::istringstream& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command;

  try {
    if (command == "peers") {
      handle_peers_command();
    }
    else if (command == "known") {
      handle_known_command();
    }
    else if (command == "send") {
      handle_send_command(args);
    }
    else if (command == "sendfile") {
      handle_sendfile_command(args);
    }
    else if (command == "history") {
      handle_history_command(args);
    }
    else if (command == "export") {
      handle_export_command(args);
    }
    else if (command == "cleanup") {
      handle_cleanup_command();
    }
    else if (command == "stats") {
      handle_stats_command();
    }
    else if (command == "status") {
      handle_status_command();
    }
    else if (command == "name") {
      handle_name_command(args);
    }
    else if (command == "help") {
      handle_help_command();
    }
    else {
      print("Unknown command. Type 'help' for a list of commands");
    }
  }
  catch (const std::exception& e) {
    log_and_display_error("Error executing " + command, e.what());
  }
}

void CLI::handle_peers_command() {
  const auto peers = engine_.get_peers();
  if (peers.empty()) {
    print("No peers online");
    return;
  }

  std::ostringstream ss;
  for (const auto& peer : peers) {
    ss << "  " << std::left << std::setw(16) << peer.ip << peer.username << "\n";
  }
  print(ss.str());
}

void CLI::handle_known_command() {
  const auto peers = engine_.known_peers();
  if (peers.empty()) {
    print("No known peers");
    return;
  }

  std::ostringstream ss;
  for (const auto& peer : peers) {
    ss << "  " << std::left << std::setw(16) << peer.ip << std::setw(24) << peer.username
       << "last seen " << store::format_local_time(peer.last_seen) << "\n";
  }
  print(ss.str());
}

void CLI::handle_send_command(std::istringstream& args) {
  std::string ip;
  std::string text;
  args >> ip;
  std::getline(args >> std::ws, text);
  if (ip.empty() || text.empty()) {
    print("Usage: send <ip> <text>");
    return;
  }

  const auto result = engine_.send_message(ip, text).get();
  print(result.ok() ? "Sent" : std::string("Send failed: ") + network::to_string(result.status) + " " + result.detail);
}

void CLI::handle_sendfile_command(std::istringstream& args) {
  std::string ip;
  std::string path;
  args >> ip;
  std::getline(args >> std::ws, path);
  if (ip.empty() || path.empty()) {
    print("Usage: sendfile <ip> <path>");
    return;
  }

  const auto result = engine_.send_file(ip, path).get();
  print(result.ok() ? "File sent" : std::string("Send failed: ") + network::to_string(result.status) + " " + result.detail);
}

void CLI::handle_history_command(std::istringstream& args) {
  std::string ip;
  std::size_t limit = 20;
  if (!(args >> ip)) {
    print("Usage: history <ip> [limit]");
    return;
  }
  if (!(args >> limit)) {
    limit = 20;
  }

  const auto messages = engine_.get_history(ip, limit);
  if (messages.empty()) {
    print("No messages with " + ip);
    return;
  }

  const std::string peer_name = engine_.peer_username(ip).value_or(ip);
  std::ostringstream ss;
  for (const auto& message : messages) {
    ss << "[" << store::format_local_time(message.timestamp) << "] "
       << (message.sender == store::Sender::ME ? "You" : peer_name) << ": ";
    if (message.type == store::ContentType::FILE) {
      ss << "[FILE] " << message.content;
      if (!message.file_path.empty()) {
        ss << " (" << message.file_path << ")";
      }
    } else {
      ss << message.content;
    }
    ss << "\n";
  }
  print(ss.str());
}

void CLI::handle_export_command(std::istringstream& args) {
  std::string ip;
  std::string path;
  args >> ip;
  std::getline(args >> std::ws, path);
  if (ip.empty() || path.empty()) {
    print("Usage: export <ip> <path>");
    return;
  }

  const std::size_t count = engine_.export_chat(ip, path);
  print("Exported " + std::to_string(count) + " messages to " + path);
}

void CLI::handle_cleanup_command() {
  const std::size_t removed = engine_.cleanup_now();
  print("Removed " + std::to_string(removed) + " messages older than "
        + std::to_string(config_.retention_hours()) + " hours");
}

void CLI::handle_stats_command() {
  const auto stats = engine_.statistics();
  std::ostringstream ss;
  ss << "  Messages: " << stats.total_messages << "\n"
     << "  Peers:    " << stats.total_peers << "\n";
  if (stats.oldest_message) {
    ss << "  Oldest:   " << store::format_local_time(*stats.oldest_message) << "\n";
  }
  if (stats.newest_message) {
    ss << "  Newest:   " << store::format_local_time(*stats.newest_message) << "\n";
  }
  print(ss.str());
}

void CLI::handle_status_command() {
  const auto net = engine_.network_status();
  std::ostringstream ss;
  ss << "  Engine:   " << engine_.status() << "\n"
     << "  Username: " << engine_.username() << "\n"
     << "  Address:  " << net.local_ip << " (" << network::to_string(net.type) << ")\n"
     << "  Network:  " << (net.connected ? "connected" : "disconnected") << "\n";
  print(ss.str());
}

void CLI::handle_name_command(std::istringstream& args) {
  std::string name;
  std::getline(args >> std::ws, name);
  if (name.empty()) {
    print("Current name: " + config_.username());
    return;
  }

  config_.set_username(name);
  print("Name changed to " + config_.username());
}

void CLI::handle_help_command() {
  std::ostringstream ss;
  ss << "Available commands:\n"
     << "  peers                   List peers currently online\n"
     << "  known                   List every peer ever seen\n"
     << "  send <ip> <text>        Send a text message\n"
     << "  sendfile <ip> <path>    Send a file\n"
     << "  history <ip> [limit]    Show recent messages with a peer\n"
     << "  export <ip> <path>      Write the chat with a peer to a file\n"
     << "  cleanup                 Delete messages older than the retention period\n"
     << "  stats                   Show storage statistics\n"
     << "  status                  Show engine and network status\n"
     << "  name [username]         Show or change your username\n"
     << "  help                    Display this help message\n"
     << "  quit                    Exit the shell\n";
  print(ss.str());
}

void CLI::print(const std::string& text) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_ << text;
  if (text.empty() || text.back() != '\n') {
    output_ << "\n";
  }
  output_ << std::flush;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  print(message + ": " + error);
}

} // namespace cli
} // namespace ghostnet
