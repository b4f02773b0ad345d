#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Config.hpp"
#include "DocumentCache.hpp"
#include "DownloadCache.hpp"
#include "FetchError.hpp"
#include "Logger.hpp"
#include "RemoteFetcher.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void usage() {
  std::cerr << "usage: pdfcache [--config FILE] fetch [--force] URL...\n"
               "       pdfcache [--config FILE] stats\n"
               "       pdfcache [--config FILE] clear\n";
}

int fetch(const Config& conf, const std::vector<std::string>& args) {
  bool force = false;
  std::vector<std::string> urls;
  for (const auto& a : args) {
    if (a == "--force")
      force = true;
    else
      urls.push_back(a);
  }
  if (urls.empty()) {
    usage();
    return kExitUsage;
  }

  DownloadCache downloads(conf.GetDownloadDir());
  RemoteFetcher fetcher(downloads, conf);

  // Pair each future with its URL for diagnostic logging
  std::vector<std::pair<std::string, std::future<std::filesystem::path>>>
    futures;
  futures.reserve(urls.size());
  for (const auto& url : urls)
    futures.emplace_back(url, fetcher.FetchAsync(url, force));

  int rc = kExitOk;
  using namespace std::chrono_literals;
  while (!futures.empty()) {
    bool progressed = false;

    for (auto it = futures.begin(); it != futures.end();) {
      auto& [url, fut] = *it;
      if (fut.wait_for(250ms) == std::future_status::ready) {
        try {
          std::cout << url << "\t" << fut.get().string() << "\n";
        } catch (const BlockedURL& e) {
          logr::error << "Blocked (" << BlockedURL::ReasonName(e.GetReason())
                      << "): " << e.what();
          rc = kExitFailed;
        } catch (const std::exception& e) {
          logr::error << "Fetch of " << url << " failed: " << e.what();
          rc = kExitFailed;
        }
        it = futures.erase(it);
        progressed = true;
      } else {
        ++it;
      }
    }

    if (!progressed) {
      logr::info << "Waiting on " << futures.size() << " download(s):";
      for (auto& p : futures)
        logr::info << "  - " << p.first;
    }
  }
  return rc;
}

int stats(const Config& conf) {
  DownloadCache downloads(conf.GetDownloadDir());
  DocumentCache content(conf.GetContentDir(), conf.GetContentTtl());

  const auto d = downloads.GetStats();
  const auto c = content.GetStats();
  std::cout << "downloads: " << d.cache_dir.string() << "\n"
            << "  files: " << d.file_count << "\n"
            << "  bytes: " << d.total_bytes << "\n"
            << "content: " << c.cache_dir.string() << "\n"
            << "  documents: " << c.total_files << "\n"
            << "  pages: " << c.total_pages << "\n"
            << "  bytes: " << c.cache_size_bytes << "\n";
  return kExitOk;
}

int clear(const Config& conf) {
  DownloadCache downloads(conf.GetDownloadDir());
  DocumentCache content(conf.GetContentDir(), conf.GetContentTtl());

  const auto removed = downloads.Clear();
  content.ClearAll();
  std::cout << "removed " << removed << " downloaded file(s)\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::filesystem::path> conf_file;
  if (args.size() >= 2 && args[0] == "--config") {
    conf_file = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return kExitUsage;
  }

  const std::string command = args.front();
  args.erase(args.begin());

  try {
    const Config conf = conf_file ? Config(*conf_file) : Config();
    if (conf.GetConfigFile().empty())
      logr::debug << "No config file found, using defaults";
    else
      logr::debug << "Config: " << conf.GetConfigFile();

    if (command == "fetch")
      return fetch(conf, args);
    if (command == "stats" && args.empty())
      return stats(conf);
    if (command == "clear" && args.empty())
      return clear(conf);
  } catch (const std::exception& e) {
    logr::error << e.what();
    return kExitFailed;
  }

  usage();
  return kExitUsage;
}
