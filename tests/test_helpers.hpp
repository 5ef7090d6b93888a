#pragma once

#include "utils/reporter.hpp"
#include <arpa/inet.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <netinet/in.h>
#include <random>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

// Unique directory under the system temp dir, removed on destruction.
class TempTestDir {
public:
  TempTestDir() {
    std::random_device rd;
    std::string unique_name = "folio_test_" + std::to_string(rd()) + "_" +
                              std::to_string(rd());
    path = std::filesystem::temp_directory_path() / unique_name;
    std::filesystem::create_directories(path);
    path = std::filesystem::canonical(path);
  }

  ~TempTestDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  std::filesystem::path path;
};

inline void write_file(const std::filesystem::path &path,
                       const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
}

// Records every message so tests can assert on content and order.
class MemoryReporter : public Reporter {
private:
  mutable std::mutex mutex_;
  std::vector<std::pair<LogLevel, std::string>> entries;

public:
  void log(LogLevel level, const std::string &message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.emplace_back(level, message);
  }

  std::vector<std::pair<LogLevel, std::string>> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries;
  }

  // Index of the first message containing text, or -1.
  int index_of(const std::string &text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < entries.size(); ++i) {
      if (entries[i].second.find(text) != std::string::npos) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  bool contains(const std::string &text) const { return index_of(text) >= 0; }

  size_t count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &entry : entries) {
      if (entry.first == level)
        ++n;
    }
    return n;
  }
};

// Sends one raw request to 127.0.0.1:port and returns the whole reply.
inline std::string http_request(unsigned short port,
                                const std::string &request) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return "";
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

  if (connect(fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
    close(fd);
    return "";
  }

  send(fd, request.data(), request.size(), MSG_NOSIGNAL);

  std::string reply;
  char buffer[4096];
  ssize_t n;
  while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
    reply.append(buffer, static_cast<size_t>(n));
  }
  close(fd);
  return reply;
}

inline std::string http_get(unsigned short port, const std::string &path) {
  return http_request(port, "GET " + path +
                                " HTTP/1.1\r\nHost: localhost\r\n\r\n");
}

inline int status_of(const std::string &reply) {
  if (reply.size() < 12) {
    return 0;
  }
  return std::atoi(reply.substr(9, 3).c_str());
}

inline std::string body_of(const std::string &reply) {
  size_t pos = reply.find("\r\n\r\n");
  return pos == std::string::npos ? "" : reply.substr(pos + 4);
}

template <typename Predicate>
bool wait_until(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}
