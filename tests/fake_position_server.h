#pragma once

// Scripted stand-in for the motor process: binds a Unix socket in a private
// temp directory, accepts one client and answers each 2-byte request with the
// next scripted reply.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <system_error>
#include <cstring>
#include <deque>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "pos_client.h"

/// Response frame exactly as the motor process writes it.
inline std::vector<uint8_t> make_response(double pos, int64_t sec, int64_t nsec,
                                          uint8_t n_bytes = kResponseLength,
                                          uint8_t cmd = kCmdGetPos) {
    std::vector<uint8_t> out(kResponseFrameSize);
    out[0] = n_bytes;
    out[1] = cmd;
    std::memcpy(&out[2], &pos, sizeof(double));
    std::memcpy(&out[10], &sec, sizeof(int64_t));
    std::memcpy(&out[18], &nsec, sizeof(int64_t));
    return out;
}

/// Private directory under /tmp, removed with everything in it.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/pos_cli_test_XXXXXX";
        if (::mkdtemp(tmpl) == nullptr) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

/// Leaves a socket file behind with nothing listening on it.
inline void make_dead_socket_file(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error("socket failed");
    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        throw std::runtime_error("bind failed");
    }
    ::close(fd);
}

class FakePositionServer {
public:
    /// One scripted answer to a request.
    struct Reply {
        std::vector<uint8_t> bytes;
        size_t split_at = 0;                 ///< >0: send in two writes
        int gap_ms = 0;                      ///< pause between the two writes
        bool close_after = false;            ///< close the connection after sending
    };

    explicit FakePositionServer(const std::string& path) : path_(path) {
        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");

        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        ::unlink(path.c_str());
        if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 1) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
    }

    ~FakePositionServer() {
        running_.store(false);
        if (thread_.joinable()) thread_.join();
        close_client();
        ::close(listen_fd_);
        ::unlink(path_.c_str());
    }

    void push(Reply r) {
        std::lock_guard<std::mutex> lk(mtx_);
        script_.push_back(std::move(r));
    }
    void push(const std::vector<uint8_t>& bytes) { push(Reply{bytes, 0, 0, false}); }

    /// Bytes written right after accept, before any request.
    void set_greeting(const std::vector<uint8_t>& bytes) { greeting_ = bytes; }

    /// Once the script is exhausted keep answering with this frame.
    void set_default_reply(const std::vector<uint8_t>& bytes) { default_reply_ = bytes; }

    void start() { thread_ = std::thread(&FakePositionServer::serve, this); }

    size_t requests_seen() const { return requests_.load(); }
    bool last_request_valid() const { return last_valid_.load(); }

private:
    void serve() {
        while (running_.load() && client_fd_ < 0) {
            struct pollfd pfd{};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 10) > 0) client_fd_ = ::accept(listen_fd_, nullptr, nullptr);
        }
        if (client_fd_ < 0) return;

        if (!greeting_.empty()) write_all(greeting_.data(), greeting_.size());

        while (running_.load() && client_fd_ >= 0) {
            struct pollfd pfd{};
            pfd.fd = client_fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 10) <= 0) continue;

            uint8_t req[kRequestFrameSize];
            if (!read_exact(req, sizeof(req))) { close_client(); break; }
            ++requests_;
            last_valid_.store(req[0] == 1 && req[1] == kCmdGetPos);

            Reply r;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (!script_.empty()) {
                    r = std::move(script_.front());
                    script_.pop_front();
                } else if (!default_reply_.empty()) {
                    r.bytes = default_reply_;
                } else {
                    continue;  // silent: the client times out
                }
            }

            if (r.split_at > 0 && r.split_at < r.bytes.size()) {
                write_all(r.bytes.data(), r.split_at);
                std::this_thread::sleep_for(std::chrono::milliseconds(r.gap_ms));
                write_all(r.bytes.data() + r.split_at, r.bytes.size() - r.split_at);
            } else {
                write_all(r.bytes.data(), r.bytes.size());
            }
            if (r.close_after) close_client();
        }
    }

    bool read_exact(uint8_t* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(client_fd_, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    void write_all(const uint8_t* data, size_t len) {
        size_t sent = 0;
        while (sent < len) {
            ssize_t n = ::send(client_fd_, data + sent, len - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    void close_client() {
        if (client_fd_ >= 0) {
            ::close(client_fd_);
            client_fd_ = -1;
        }
    }

    std::string path_;
    int listen_fd_{-1};
    int client_fd_{-1};
    std::thread thread_;
    std::atomic<bool> running_{true};
    std::atomic<size_t> requests_{0};
    std::atomic<bool> last_valid_{false};
    std::mutex mtx_;
    std::deque<Reply> script_;
    std::vector<uint8_t> greeting_;
    std::vector<uint8_t> default_reply_;
};
