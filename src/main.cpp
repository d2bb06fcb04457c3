#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>

#include "node_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    NodeEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser("friendsync");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      print_err(nullptr, "{}", parser.usage());
      return 1;
    }
    if(settings->help_requested()) {
      print_out(nullptr, "{}", parser.usage());
      return 0;
    }

    NodeEngine engine(settings, options);
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    logger->print("friendsync node {} listening on port {}", engine.peer_id(), engine.listen_port());
    logger->print("Share this connection string with friends: {}", engine.connection_string());

    engine.start_background();

    // Park the main thread until SIGINT/SIGTERM.
    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code&, int signo){
      logger->info("Signal {} received, shutting down", signo);
    });
    signal_io.run();

    engine.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("friendsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
