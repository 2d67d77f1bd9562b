// pos_client.cpp

#ifdef DEBUG
#define POSCLI_LOG(x) do { std::cerr << x << std::endl; } while(0)
#else
#define POSCLI_LOG(x) do {} while(0)
#endif

#include "pos_client.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <limits>

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

// ──────────────── 내부 유틸 ────────────────
namespace {

constexpr int64_t kNsPerSec = 1000000000LL;

static std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

template <typename T>
static inline T load_native(const uint8_t* p) noexcept {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return v;
}

static inline int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

// ──────────────── Errors ────────────────
ConnectionError::ConnectionError(const std::string& what, int error_code)
: PosCliError(errno_message(what, error_code)), error_code_(error_code) {}

ConnectionTimeout::ConnectionTimeout(const std::string& what)
: ConnectionError(what, ETIMEDOUT) {}


// ──────────────── PosCli::UnixSocket ────────────────
class PosCli::UnixSocket {
public:
    explicit UnixSocket(const std::string& path) : path_(path) {
        std::memset(&addr_, 0, sizeof(addr_));
        if (path.size() >= sizeof(addr_.sun_path))
            throw ConnectionError("socket path too long: " + path, ENAMETOOLONG);

        sock_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (sock_ < 0)
            throw ConnectionError("socket() failed", errno);

        addr_.sun_family = AF_UNIX;
        std::strncpy(addr_.sun_path, path.c_str(), sizeof(addr_.sun_path) - 1);

        if (::connect(sock_, reinterpret_cast<struct sockaddr*>(&addr_), sizeof(addr_)) < 0) {
            int err = errno;
            ::close(sock_);
            sock_ = -1;
            throw ConnectionError("connect() to " + path + " failed", err);
        }

        POSCLI_LOG("[UnixSocket] connected to " << path_ << " (fd=" << sock_ << ")");
    }

    ~UnixSocket() {
        if (sock_ >= 0) {
            ::shutdown(sock_, SHUT_RDWR);
            ::close(sock_);
        }
    }

    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;

    void send_all(const uint8_t* data, size_t len) {
        size_t sent_total = 0;
        while (sent_total < len) {
            // MSG_NOSIGNAL: a dead peer is reported as EPIPE, not SIGPIPE
            ssize_t n = ::send(sock_, data + sent_total, len - sent_total, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw ConnectionError("send() failed", errno);
            }
            sent_total += static_cast<size_t>(n);
        }
    }

    // Read exactly len bytes or throw. The deadline covers the whole frame.
    void recv_exact(uint8_t* buf, size_t len, int timeout_ms) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        size_t got = 0;

        while (got < len) {
            struct pollfd pfd{};
            pfd.fd = sock_;
            pfd.events = POLLIN;

            int r = ::poll(&pfd, 1, remaining_ms(deadline));
            if (r < 0) {
                if (errno == EINTR) continue;
                throw ConnectionError("poll() failed", errno);
            }
            if (r == 0)
                throw ProtocolError("response timeout after " + std::to_string(got) +
                                    " of " + std::to_string(len) + " bytes");

            ssize_t n = ::recv(sock_, buf + got, len - got, 0);
            if (n < 0) {
                int err = errno;
                if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) continue;
                throw ConnectionError("recv() failed", err);
            }
            if (n == 0)
                throw ProtocolError("connection closed after " + std::to_string(got) +
                                    " of " + std::to_string(len) + " bytes");
            got += static_cast<size_t>(n);
        }
    }

    // Discard whatever is already queued without blocking. Returns the byte count.
    size_t drain() {
        std::array<uint8_t, 256> buf;
        size_t dropped = 0;
        for (;;) {
            ssize_t n = ::recv(sock_, buf.data(), buf.size(), MSG_DONTWAIT);
            if (n > 0) { dropped += static_cast<size_t>(n); continue; }
            if (n == 0) break;  // peer closed; the following send/recv reports it
            int err = errno;
            if (err == EINTR) continue;
            if (err == EAGAIN || err == EWOULDBLOCK) break;
            throw ConnectionError("recv() failed", err);
        }
        return dropped;
    }

private:
    int sock_{-1};
    std::string path_;
    struct sockaddr_un addr_{};
};


// ──────────────── PosCli ────────────────
PosCli::PosCli(const PosCliConfig& config)
: config_(config) {}

PosCli::~PosCli() = default;

void PosCli::connect() {
    if (socket_) return;

    wait_for_socket_path();
    socket_.reset(new UnixSocket(config_.socket_path));
}

void PosCli::close() {
    if (running_.load(std::memory_order_acquire))
        throw PosCliError("close() while run() is active; call stop() first");
    socket_.reset();
}

bool PosCli::is_connected() const noexcept {
    return socket_ != nullptr;
}

void PosCli::wait_for_socket_path() {
    using clock = std::chrono::steady_clock;
    const bool bounded = config_.connect_timeout_ms > 0;
    const auto deadline = clock::now() + std::chrono::milliseconds(config_.connect_timeout_ms);
    const int delay_max = std::max(1, config_.poll_max_ms);
    int delay = std::min(std::max(1, config_.poll_initial_ms), delay_max);

    for (;;) {
        path_checks_.fetch_add(1, std::memory_order_relaxed);
        if (::access(config_.socket_path.c_str(), F_OK) == 0) return;

        int sleep_ms = delay;
        if (bounded) {
            if (clock::now() >= deadline)
                throw ConnectionTimeout("socket " + config_.socket_path + " did not appear within " +
                                        std::to_string(config_.connect_timeout_ms) + " ms");
            // round up so the last sleep reaches the deadline
            sleep_ms = std::min(sleep_ms, remaining_ms(deadline) + 1);
        }

        POSCLI_LOG("[PosCli::connect] waiting for " << config_.socket_path << " (" << sleep_ms << " ms)");
        if (wait_stop_for(sleep_ms))
            throw ConnectionError("connect to " + config_.socket_path + " cancelled", ECANCELED);

        // doubling a delay near INT_MAX must not overflow
        delay = (delay > delay_max / 2) ? delay_max : delay * 2;
    }
}

bool PosCli::wait_stop_for(int timeout_ms) {
    std::unique_lock<std::mutex> lk(stop_mtx_);
    return stop_cv_.wait_for(lk, std::chrono::milliseconds(std::max(0, timeout_ms)),
                             [this] { return stop_.load(std::memory_order_acquire); });
}

void PosCli::stop() {
    {
        std::lock_guard<std::mutex> lk(stop_mtx_);
        stop_.store(true, std::memory_order_release);
    }
    stop_cv_.notify_all();
}

std::array<uint8_t, kRequestFrameSize> PosCli::build_request(uint8_t command) {
    return {{static_cast<uint8_t>(kRequestFrameSize - 1), command}};
}

std::vector<uint8_t> PosCli::request_position_frame() {
    if (!socket_)
        throw ConnectionError("request_position_frame() while not connected", ENOTCONN);

    size_t stale = socket_->drain();
    if (stale > 0)
        std::cerr << "[PosCli::request_position_frame] discarded " << stale << " stale bytes\n";

    const auto req = build_request(kCmdGetPos);
    socket_->send_all(req.data(), req.size());

    std::vector<uint8_t> frame(kResponseFrameSize);
    socket_->recv_exact(frame.data(), frame.size(), config_.response_timeout_ms);
    return frame;
}

PositionSample PosCli::request_position() {
    requests_.fetch_add(1, std::memory_order_relaxed);
    round_trip_.start();
    PositionSample s = decode(request_position_frame());
    round_trip_.stop();
#ifdef DEBUG
    round_trip_.print_latest(std::cerr);
#endif
    return s;
}

PositionSample PosCli::decode(const uint8_t* data, size_t len) {
    if (data == nullptr || len != kResponseFrameSize)
        throw ProtocolError("response frame must be " + std::to_string(kResponseFrameSize) +
                            " bytes, got " + std::to_string(data ? len : 0));

    const uint8_t n_bytes = data[0];
    const uint8_t command = data[1];
    if (n_bytes != kResponseLength)
        throw ProtocolError("length echo mismatch: expected " + std::to_string(static_cast<int>(kResponseLength)) +
                            " got " + std::to_string(static_cast<int>(n_bytes)));
    if (command != kCmdGetPos)
        throw ProtocolError("command echo mismatch: expected " + std::to_string(static_cast<int>(kCmdGetPos)) +
                            " got " + std::to_string(static_cast<int>(command)));

    const double  position = load_native<double>(data + 2);
    const int64_t sec      = load_native<int64_t>(data + 10);
    const int64_t nsec     = load_native<int64_t>(data + 18);

    if (nsec < 0 || nsec >= kNsPerSec)
        throw ProtocolError("nanoseconds out of range: " + std::to_string(nsec));
    if (sec > (std::numeric_limits<int64_t>::max() - nsec) / kNsPerSec ||
        sec < std::numeric_limits<int64_t>::min() / kNsPerSec)
        throw ProtocolError("timestamp overflows int64: sec=" + std::to_string(sec));

    PositionSample s;
    s.position = position;
    s.timestamp_ns = sec * kNsPerSec + nsec;
    return s;
}

void PosCli::run(const std::function<void(const PositionSample&)>& on_sample) {
    if (running_.exchange(true, std::memory_order_acq_rel))
        throw PosCliError("run() is already active");
    struct RunningGuard {
        std::atomic<bool>& flag;
        ~RunningGuard() { flag.store(false, std::memory_order_release); }
    } guard{running_};

    connect();

    while (!stop_requested()) {
        if (wait_stop_for(config_.request_period_ms)) break;

        PositionSample s;
        try {
            s = request_position();
        } catch (const ProtocolError& e) {
            protocol_errors_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[PosCli::run] request dropped: " << e.what() << "\n";
            continue;
        }

        POSCLI_LOG("[PosCli::run] pos=" << s.position << " t=" << s.timestamp_ns);
        if (on_sample) on_sample(s);
    }
}
