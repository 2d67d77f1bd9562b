#pragma once

#include <string>
#include <vector>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>

#include "utils/latency_meter.h"

// ────────────────────────────────
// Errors
// ────────────────────────────────

/// Base class of everything PosCli throws.
class PosCliError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Socket could not be opened, connected, written or read. Carries errno.
class ConnectionError : public PosCliError {
public:
  ConnectionError(const std::string& what, int error_code);

  int error_code() const noexcept { return error_code_; }

private:
  int error_code_;
};

/// The socket path did not appear within connect_timeout_ms.
class ConnectionTimeout : public ConnectionError {
public:
  explicit ConnectionTimeout(const std::string& what);
};

/// Short, late or malformed response frame.
class ProtocolError : public PosCliError {
public:
  using PosCliError::PosCliError;
};

// ────────────────────────────────
// Wire protocol
// ────────────────────────────────

/// Opcodes understood by the motor process. Only kCmdGetPos is issued here.
enum PosCmd : uint8_t {
  kCmdMove    = 0x01,
  kCmdStop    = 0x02,
  kCmdFinish  = 0x03,
  kCmdGetPos  = 0x04,
  kCmdParams  = 0x05,
};

constexpr size_t kRequestFrameSize  = 2;   ///< [length][command]
constexpr size_t kResponseFrameSize = 26;  ///< [length][command][f64][i64][i64]
constexpr uint8_t kResponseLength   = static_cast<uint8_t>(kResponseFrameSize - 1);

/// One decoded position reading.
struct PositionSample {
  double  position{0.0};      ///< Axis position as reported by the motor process
  int64_t timestamp_ns{0};    ///< CLOCK_MONOTONIC of the motor process, in ns
};

/// Client settings. The defaults match the deployed motor process.
struct PosCliConfig {
  std::string socket_path = "/home/nvidia/pef_pr21/sock_bf";
  int connect_timeout_ms  = 0;     ///< <= 0 waits for the socket file forever
  int poll_initial_ms     = 100;   ///< first delay between path checks
  int poll_max_ms         = 1000;  ///< backoff ceiling
  int response_timeout_ms = 500;   ///< per request, whole frame
  int request_period_ms   = 100;   ///< sleep before each request in run()
};

/**
 * @brief Unix domain socket client for the motor position protocol.
 *
 * PosCli waits for the motor process to publish its socket file, connects,
 * and then issues GETPOS requests. Each request is a fixed 2-byte frame and
 * each reply a fixed 26-byte frame, so no framing state survives a request.
 *
 * All calls block on the calling thread. stop() is the only method that may
 * be called concurrently; it cancels connect() while it is waiting for the
 * socket path and makes run() return after the current request.
 */
class PosCli {
public:
  explicit PosCli(const PosCliConfig& config = PosCliConfig());

  PosCli(const PosCli&) = delete;
  PosCli& operator=(const PosCli&) = delete;

  /// Closes the connection if one is open.
  ~PosCli();

  // ────────────────────────────────
  // Connection
  // ────────────────────────────────

  /**
   * @brief Wait for the socket path to exist and connect to it.
   *
   * Path checks back off exponentially from poll_initial_ms to poll_max_ms.
   * No-op when already connected.
   *
   * @throws ConnectionTimeout  path still missing after connect_timeout_ms
   * @throws ConnectionError    connect() failed, or stop() was called while waiting
   */
  void connect();

  /**
   * @brief Release the socket. Safe to call when not connected.
   * @throws PosCliError  run() is active; stop() it first
   */
  void close();

  bool is_connected() const noexcept;

  /// Number of times connect() has checked for the socket path.
  size_t path_checks() const noexcept { return path_checks_.load(std::memory_order_relaxed); }

  // ────────────────────────────────
  // Requests
  // ────────────────────────────────

  /**
   * @brief Send one GETPOS request and return the raw 26-byte reply.
   *
   * Stale bytes already queued on the socket are discarded first.
   *
   * @throws ConnectionError  not connected, or the peer is gone
   * @throws ProtocolError    peer closed mid-frame or response_timeout_ms expired
   */
  std::vector<uint8_t> request_position_frame();

  /// request_position_frame() followed by decode(). Records the round trip.
  PositionSample request_position();

  /**
   * @brief Poll the motor position until stop() is called.
   *
   * Connects first if needed. A ProtocolError fails only the request it
   * occurred in; a ConnectionError ends the loop and is rethrown.
   *
   * @param on_sample  called with every decoded sample, may be empty
   * @throws PosCliError  run() is already active on this client
   */
  void run(const std::function<void(const PositionSample&)>& on_sample = nullptr);

  /// Cancel connect() / run(). Thread-safe; the client stays stopped.
  void stop();

  bool stop_requested() const noexcept { return stop_.load(std::memory_order_acquire); }

  bool running() const noexcept { return running_.load(std::memory_order_acquire); }

  // ────────────────────────────────
  // Frame codec
  // ────────────────────────────────

  /// [1, command]
  static std::array<uint8_t, kRequestFrameSize> build_request(uint8_t command = kCmdGetPos);

  /**
   * @brief Decode a GETPOS response frame.
   * @throws ProtocolError  wrong size, wrong echo bytes, or an invalid timestamp
   */
  static PositionSample decode(const uint8_t* data, size_t len);
  static PositionSample decode(const std::vector<uint8_t>& frame) {
    return decode(frame.data(), frame.size());
  }

  // ────────────────────────────────
  // Statistics
  // ────────────────────────────────

  const PosCliConfig& config() const noexcept { return config_; }
  const LatencyMeter& round_trip() const noexcept { return round_trip_; }
  uint64_t requests() const noexcept { return requests_.load(std::memory_order_relaxed); }
  uint64_t protocol_errors() const noexcept { return protocol_errors_.load(std::memory_order_relaxed); }

private:
  /// Block until the socket file exists; see connect() for the policy.
  void wait_for_socket_path();

  /// Sleep up to timeout_ms. Returns true if stop() was called.
  bool wait_stop_for(int timeout_ms);

  PosCliConfig config_;

  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;

  std::atomic<size_t> path_checks_{0};
  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> protocol_errors_{0};
  LatencyMeter round_trip_{"round_trip"};

  // ────────────────────────────────
  // Internal Unix socket handler
  // ────────────────────────────────
  class UnixSocket;
  std::unique_ptr<UnixSocket> socket_;
};
