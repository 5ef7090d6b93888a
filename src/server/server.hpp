#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <netinet/in.h>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <unistd.h>
#include <unordered_map>
#include <vector>

struct Request {
  std::string method;
  std::string path;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
};

struct Response {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  std::string to_http(bool include_body = true) const {
    std::ostringstream oss;
    std::string status_text = get_status_text(status);

    oss << "HTTP/1.1 " << status << " " << status_text << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (include_body) {
      oss << body;
    }
    return oss.str();
  }

private:
  std::string get_status_text(int code) const {
    switch (code) {
    case 200:
      return "OK";
    case 301:
      return "Moved Permanently";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    default:
      return "Unknown";
    }
  }
};

using Logger = std::function<void(const Request &, const Response &)>;

// Single-threaded static file server. bind() runs on the caller's thread;
// serve() blocks until stop() is called from another thread.
class Server {
private:
  std::atomic<int> server_fd{-1};
  std::atomic<bool> running{false};
  std::filesystem::path root;
  std::map<std::string, std::string> default_headers;
  Logger logger;

  static Request parse_request(const std::string &raw) {
    Request req;
    std::istringstream iss(raw);
    std::string line;

    if (std::getline(iss, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      std::istringstream line_stream(line);
      line_stream >> req.method >> req.path >> req.version;
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
      if (line.back() == '\r')
        line.pop_back();
      size_t colon = line.find(':');
      if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        req.headers[key] = value_start == std::string::npos
                               ? ""
                               : line.substr(value_start);
      }
    }

    return req;
  }

  static bool ends_with(const std::string &str, const std::string &suffix) {
    if (suffix.size() > str.size())
      return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  static std::string get_mime_type(const std::string &path) {
    if (ends_with(path, ".html") || ends_with(path, ".htm"))
      return "text/html";
    if (ends_with(path, ".css"))
      return "text/css";
    if (ends_with(path, ".js"))
      return "application/javascript";
    if (ends_with(path, ".json"))
      return "application/json";
    if (ends_with(path, ".png"))
      return "image/png";
    if (ends_with(path, ".jpg") || ends_with(path, ".jpeg"))
      return "image/jpeg";
    if (ends_with(path, ".gif"))
      return "image/gif";
    if (ends_with(path, ".webp"))
      return "image/webp";
    if (ends_with(path, ".svg"))
      return "image/svg+xml";
    if (ends_with(path, ".ico"))
      return "image/x-icon";
    if (ends_with(path, ".woff"))
      return "font/woff";
    if (ends_with(path, ".woff2"))
      return "font/woff2";
    if (ends_with(path, ".ttf"))
      return "font/ttf";
    if (ends_with(path, ".pdf"))
      return "application/pdf";
    if (ends_with(path, ".tex"))
      return "text/x-tex";
    if (ends_with(path, ".xml") || ends_with(path, ".ptx"))
      return "application/xml";
    if (ends_with(path, ".txt"))
      return "text/plain";
    return "application/octet-stream";
  }

  static std::string url_decode(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
      if (text[i] == '%' && i + 2 < text.size() &&
          std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
          std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
        out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
        i += 2;
      } else {
        out += text[i];
      }
    }
    return out;
  }

  static std::string html_escape(const std::string &text) {
    std::string out;
    for (char c : text) {
      switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
      }
    }
    return out;
  }

  static std::string directory_listing(const std::filesystem::path &dir,
                                       const std::string &url_path) {
    std::vector<std::string> names;
    for (const auto &entry : std::filesystem::directory_iterator(dir)) {
      std::string name = entry.path().filename().string();
      if (entry.is_directory()) {
        name += "/";
      }
      names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head><meta charset=\"utf-8\">"
         << "<title>Directory listing for " << html_escape(url_path)
         << "</title></head>\n<body>\n<h1>Directory listing for "
         << html_escape(url_path) << "</h1>\n<hr>\n<ul>\n";
    for (const auto &name : names) {
      html << "<li><a href=\"" << html_escape(name) << "\">"
           << html_escape(name) << "</a></li>\n";
    }
    html << "</ul>\n<hr>\n</body>\n</html>\n";
    return html.str();
  }

  static std::optional<std::string> read_file(const std::filesystem::path &p) {
    std::ifstream file(p, std::ios::binary);
    if (!file) {
      return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  }

  void not_found(Response &res) {
    res.status = 404;
    res.set_content("<h1>404 - File not found</h1>", "text/html");
  }

  void serve_static_file(const std::string &raw_path, Response &res) {
    std::string url_path = raw_path;
    size_t query_pos = url_path.find_first_of("?#");
    if (query_pos != std::string::npos) {
      url_path = url_path.substr(0, query_pos);
    }
    if (url_path.empty() || url_path[0] != '/') {
      res.status = 400;
      res.set_content("<h1>400 - Bad request</h1>", "text/html");
      return;
    }

    std::string decoded = url_decode(url_path);
    if (decoded.find('\0') != std::string::npos) {
      not_found(res);
      return;
    }

    size_t start = decoded.find_first_not_of('/');
    std::filesystem::path relative =
        std::filesystem::path(start == std::string::npos ? ""
                                                         : decoded.substr(start))
            .lexically_normal();
    // An absolute right-hand side would replace root in root / relative.
    if (relative.has_root_path() ||
        (!relative.empty() && *relative.begin() == "..")) {
      not_found(res);
      return;
    }
    std::filesystem::path file_path = root / relative;
    std::filesystem::path inside =
        file_path.lexically_normal().lexically_relative(root.lexically_normal());
    if (!relative.empty() && (inside.empty() || *inside.begin() == "..")) {
      not_found(res);
      return;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
      if (url_path.back() != '/') {
        res.status = 301;
        res.headers["Location"] = url_path + "/";
        return;
      }
      std::filesystem::path index = file_path / "index.html";
      if (std::filesystem::is_regular_file(index, ec)) {
        file_path = index;
      } else {
        try {
          res.set_content(directory_listing(file_path, decoded),
                          "text/html; charset=utf-8");
        } catch (const std::filesystem::filesystem_error &) {
          res.status = 403;
          res.set_content("<h1>403 - Cannot list directory</h1>",
                          "text/html");
        }
        return;
      }
    }

    if (!std::filesystem::is_regular_file(file_path, ec)) {
      not_found(res);
      return;
    }

    auto content = read_file(file_path);
    if (!content) {
      not_found(res);
      return;
    }
    res.set_content(*content, get_mime_type(file_path.string()));
  }

  static void send_all(int client_fd, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n =
          send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        if (n < 0 && errno == EINTR)
          continue;
        return;
      }
      sent += static_cast<size_t>(n);
    }
  }

  void handle_client(int client_fd) {
    timeval timeout{};
    timeout.tv_sec = 5;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string raw;
    char buffer[8192];
    while (raw.find("\r\n\r\n") == std::string::npos && raw.size() < 65536) {
      ssize_t bytes = recv(client_fd, buffer, sizeof(buffer), 0);
      if (bytes <= 0) {
        break;
      }
      raw.append(buffer, static_cast<size_t>(bytes));
    }

    if (raw.empty()) {
      close(client_fd);
      return;
    }

    Request req = parse_request(raw);
    Response res;

    if (req.method == "GET" || req.method == "HEAD") {
      serve_static_file(req.path, res);
    } else {
      res.status = 501;
      res.set_content("<h1>501 - Unsupported method</h1>", "text/html");
    }

    for (const auto &[key, value] : default_headers) {
      res.headers[key] = value;
    }

    if (logger) {
      logger(req, res);
    }

    send_all(client_fd, res.to_http(req.method != "HEAD"));
    close(client_fd);
  }

public:
  explicit Server(std::filesystem::path directory)
      : root(std::move(directory)) {}

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  ~Server() {
    stop();
    close_socket();
  }

  // Added to every response, errors and redirects included.
  void set_default_header(const std::string &key, const std::string &value) {
    default_headers[key] = value;
  }

  void set_logger(Logger log_handler) { logger = std::move(log_handler); }

  // Returns the bound port, which differs from port when port is 0.
  unsigned short bind(const std::string &host, unsigned short port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1) {
      throw std::runtime_error("Failed to create socket: " +
                               std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("Failed to set SO_REUSEADDR: " +
                               std::string(strerror(err)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
      ::close(fd);
      throw std::runtime_error("Invalid bind address: " + host);
    }

    if (::bind(fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("Bind failed on " + host + ":" +
                               std::to_string(port) + ": " + strerror(err));
    }

    if (::listen(fd, 16) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("Listen failed: " + std::string(strerror(err)));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(fd, (sockaddr *)&bound, &len);

    server_fd = fd;
    running = true;
    return ntohs(bound.sin_port);
  }

  // Accept loop. Returns once stop() has been called.
  void serve() {
    while (running) {
      sockaddr_in client_addr{};
      socklen_t client_len = sizeof(client_addr);
      int client_fd =
          accept(server_fd.load(), (sockaddr *)&client_addr, &client_len);

      if (client_fd < 0) {
        if (!running) {
          break;
        }
        if (errno == EINTR || errno == ECONNABORTED) {
          continue;
        }
        if (errno == EBADF || errno == EINVAL) {
          break;
        }
        continue;
      }

      handle_client(client_fd);
    }
  }

  // Wakes a blocked serve(). The descriptor stays open until
  // close_socket() so the serving thread never sees a reused fd.
  void stop() {
    running = false;
    int fd = server_fd.load();
    if (fd != -1) {
      shutdown(fd, SHUT_RDWR);
    }
  }

  void close_socket() {
    int fd = server_fd.exchange(-1);
    if (fd != -1) {
      ::close(fd);
    }
  }
};
