#ifndef CLUMP_TESTS_LOOPBACK_SERVER_HPP
#define CLUMP_TESTS_LOOPBACK_SERVER_HPP

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../src/utils/string_utils.hpp"

namespace clump::testing {

    // Minimal HTTP/1.1 keep-alive server on 127.0.0.1, one thread per connection:
    //   GET  /            {"message": "Hello, world!"}
    //   POST /foo         echoes the JSON body, adds "x-test: Test"
    //   *    /inspect     describes the request it received as JSON
    //   GET  /text        200 text/plain
    //   GET  /slow        answers after 50 ms
    //   GET  /hang        never answers; the connection closes when the server stops
    //   GET  /exception   drops the connection without a response
    class LoopbackServer {
       public:
        LoopbackServer() {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listen_fd_ < 0) {
                throw std::runtime_error("socket() failed");
            }

            const int reuse = 1;
            (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;

            socklen_t len = sizeof(addr);
            if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, SOMAXCONN) != 0 ||
                ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
                ::close(listen_fd_);
                throw std::runtime_error("failed to listen on loopback");
            }
            port_ = ntohs(addr.sin_port);

            acceptor_ = std::thread([this] { accept_loop(); });
        }

        ~LoopbackServer() {
            stopping_.store(true);
            ::shutdown(listen_fd_, SHUT_RDWR);
            acceptor_.join();
            ::close(listen_fd_);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (int fd : client_fds_) {
                    ::shutdown(fd, SHUT_RDWR);
                }
            }
            for (auto& worker : workers_) {
                worker.join();
            }
        }

        LoopbackServer(const LoopbackServer&) = delete;
        LoopbackServer& operator=(const LoopbackServer&) = delete;
        LoopbackServer(LoopbackServer&&) = delete;
        LoopbackServer& operator=(LoopbackServer&&) = delete;

        [[nodiscard]] std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

        [[nodiscard]] int accepted_connections() const { return accepted_.load(); }
        [[nodiscard]] int max_open_connections() const { return max_open_.load(); }

       private:
        struct ParsedRequest {
            std::string method_;
            std::string target_;
            std::string content_type_;
            std::string body_;
        };

        void accept_loop() {
            while (!stopping_.load()) {
                const int fd = ::accept(listen_fd_, nullptr, nullptr);
                if (fd < 0) {
                    if (stopping_.load()) {
                        return;
                    }
                    continue;
                }

                ++accepted_;
                const int now = ++open_;
                int seen = max_open_.load();
                while (now > seen && !max_open_.compare_exchange_weak(seen, now)) {
                }

                std::lock_guard<std::mutex> lock(mutex_);
                client_fds_.insert(fd);
                workers_.emplace_back([this, fd] { serve(fd); });
            }
        }

        void serve(int fd) {
            std::string buffer;
            while (!stopping_.load()) {
                std::optional<ParsedRequest> req = read_request(fd, buffer);
                if (!req || !respond(fd, *req)) {
                    break;
                }
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                client_fds_.erase(fd);
            }
            ::close(fd);
            --open_;
        }

        static bool fill(int fd, std::string& buffer) {
            char chunk[4096];
            const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return false;
            }
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }

        static std::optional<ParsedRequest> read_request(int fd, std::string& buffer) {
            size_t head_end = 0;
            while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
                if (!fill(fd, buffer)) {
                    return std::nullopt;
                }
            }

            ParsedRequest req;
            size_t content_length = 0;
            size_t line_start = 0;
            bool first = true;
            while (line_start < head_end) {
                size_t line_end = buffer.find("\r\n", line_start);
                const std::string line = buffer.substr(line_start, line_end - line_start);
                line_start = line_end + 2;

                if (first) {
                    const auto sp1 = line.find(' ');
                    const auto sp2 = line.find(' ', sp1 + 1);
                    req.method_ = line.substr(0, sp1);
                    req.target_ = line.substr(sp1 + 1, sp2 - sp1 - 1);
                    first = false;
                    continue;
                }

                auto header = string_utils::split_header_line(line);
                if (!header) {
                    continue;
                }
                if (string_utils::ieq(header->first, "content-length")) {
                    content_length = static_cast<size_t>(string_utils::parse_long(header->second).value_or(0));
                } else if (string_utils::ieq(header->first, "content-type")) {
                    req.content_type_ = header->second;
                }
            }

            const size_t body_start = head_end + 4;
            while (buffer.size() < body_start + content_length) {
                if (!fill(fd, buffer)) {
                    return std::nullopt;
                }
            }
            req.body_ = buffer.substr(body_start, content_length);
            buffer.erase(0, body_start + content_length);
            return req;
        }

        static bool write_all(int fd, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        static bool reply(int fd, int status, const std::string& content_type, const std::string& body,
                          const std::vector<std::string>& extra_headers = {}) {
            std::string out = "HTTP/1.1 " + std::to_string(status) + (status == 200 ? " OK" : " Not Found") + "\r\n";
            out += "Content-Type: " + content_type + "\r\n";
            out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
            for (const auto& h : extra_headers) {
                out += h + "\r\n";
            }
            out += "\r\n";
            out += body;
            return write_all(fd, out);
        }

        // false closes the connection
        bool respond(int fd, const ParsedRequest& req) {
            const std::string path = req.target_.substr(0, req.target_.find('?'));

            if (path == "/") {
                return reply(fd, 200, "application/json", R"({"message": "Hello, world!"})");
            }
            if (path == "/foo") {
                return reply(fd, 200, "application/json", req.body_.empty() ? "{}" : req.body_, {"x-test: Test"});
            }
            if (path == "/inspect") {
                const nlohmann::json seen = {
                    {"method", req.method_}, {"target", req.target_}, {"content_type", req.content_type_}, {"body", req.body_}};
                return reply(fd, 200, "application/json; charset=utf-8", seen.dump(), {"Set-Cookie: a=1", "Set-Cookie: b=2"});
            }
            if (path == "/text") {
                return reply(fd, 200, "text/plain; charset=utf-8", "plain body");
            }
            if (path == "/slow") {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return reply(fd, 200, "application/json", R"({"slow": true})");
            }
            if (path == "/hang") {
                while (!stopping_.load()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                return false;
            }
            if (path == "/exception") {
                return false;
            }
            return reply(fd, 404, "text/plain", "Not Found");
        }

        int listen_fd_ = -1;
        uint16_t port_ = 0;
        std::atomic<bool> stopping_ = false;
        std::atomic<int> accepted_ = 0;
        std::atomic<int> open_ = 0;
        std::atomic<int> max_open_ = 0;

        std::thread acceptor_;
        std::mutex mutex_;
        std::set<int> client_fds_;
        std::vector<std::thread> workers_;
    };
}  // namespace clump::testing

#endif
