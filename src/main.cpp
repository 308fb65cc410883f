#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <regex>

#include <spdlog/fmt/ranges.h>

#include "command_line_parser.hpp"
#include "directory_cache.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

void print_notifications(DirectoryCache& cache, bool print_content) {
  auto logger = cache.logger();
  auto print_entry = [logger, print_content](const char* what) {
    return [logger, print_content, what](const std::string& filename, const CachedContent& content) {
      if(print_content) {
        logger->print("{} {}: {}", what, filename, describe_content(content));
      } else {
        logger->print("{} {}", what, filename);
      }
    };
  };
  cache.on_added(print_entry("added"));
  cache.on_updated(print_entry("updated"));
  cache.on_deleted(print_entry("deleted"));
  cache.on_error([logger](const CacheFault& fault) {
    logger->print_err("error {}", fault.describe());
  });
  cache.on_files_added([logger](const std::vector<std::string>& names) {
    logger->debug("files added: [{}]", fmt::join(names, ", "));
  });
  cache.on_files_changed([logger](const std::vector<std::string>& names) {
    logger->debug("files changed: [{}]", fmt::join(names, ", "));
  });
  cache.on_files_deleted([logger](const std::vector<std::string>& names) {
    logger->debug("files deleted: [{}]", fmt::join(names, ", "));
  });
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "dircache.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "dircache");
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage(settings);
      return 0;
    }

    init_logging(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("dircache");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    int io_threads = settings.get<int>("io_threads");
    if(io_threads <= 0) {
      logger->error("Invalid io_threads '{}'", io_threads);
      return 1;
    }

    DirectoryCache::Options options;
    options.directory = settings.get<std::string>("directory");
    options.json_parsing = settings.get<bool>("json_parsing");
    options.json_suffix = settings.get<std::string>("json_suffix");
    options.io_threads = static_cast<std::size_t>(io_threads);
    auto pattern = settings.get<std::string>("filter");
    if(!pattern.empty()) {
      try {
        options.filter = NameFilter::matching(pattern);
      } catch(const std::regex_error& e) {
        logger->error("Invalid filter '{}': {}", pattern, e.what());
        return 1;
      }
    }

    asio::io_context io;
    auto cache = DirectoryCache::create(io, options, logger);
    print_notifications(*cache, settings.get<bool>("print_content"));

    int exit_code = 0;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signal_number) {
      if(ec) return;
      logger->info("Signal {} received, stopping", signal_number);
      cache->stop();
      io.stop();
    });

    cache->init([&](std::error_code ec) {
      if(ec) {
        logger->error("Unable to watch {}: {}", options.directory.string(), ec.message());
        exit_code = 1;
        signals.cancel();
        io.stop();
        return;
      }
      logger->info("Watching {} ({} entries)", options.directory.string(), cache->size());
      for(const auto& name : *cache->get_filenames()) {
        auto content = cache->get_file(name);
        if(content && settings.get<bool>("print_content")) {
          logger->print("  {}: {}", name, describe_content(*content));
        } else {
          logger->print("  {}", name);
        }
      }
    });

    io.run();
    cache->stop();
    return exit_code;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("dircache-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
