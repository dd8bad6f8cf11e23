#ifndef WORKER_HPP
#define WORKER_HPP
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"
#include "udp.hpp"

typedef std::shared_ptr<std::atomic<bool>> CancelToken;

struct WorkerConfig {
    // attempts per block before giving up
    unsigned int max_retries = 6;
    // socket deadline unless the peer negotiates a timeout
    std::chrono::milliseconds timeout{5000};
};

struct TransferResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    uint64_t bytes_transferred = 0;
    // attempts that timed out or got a stale answer
    unsigned int misses = 0;
};

// Owns one running transfer. Destroying the handle waits for it.
class TransferHandle {
public:
    TransferHandle(std::future<TransferResult> result, CancelToken cancelled);
    TransferHandle(TransferHandle &&) = default;
    TransferHandle &operator=(TransferHandle &&) = default;

    // block until the transfer finishes
    TransferResult join();
    // stop at the next attempt boundary
    void cancel();
    bool done() const;

private:
    std::future<TransferResult> result;
    CancelToken cancelled;
    std::optional<TransferResult> finished;
};

// Runs one transfer per call: socket bound to local (port 0 for an ephemeral one),
// connected to remote, serving filename with the already parsed options.
class Worker {
public:
    explicit Worker(const WorkerConfig &config = WorkerConfig());

    TransferHandle start_send(const sockaddr_in &local, const sockaddr_in &remote,
        const std::string &filename, const std::vector<TransferOption> &options);
    TransferHandle start_receive(const sockaddr_in &local, const sockaddr_in &remote,
        const std::string &filename, const std::vector<TransferOption> &options);

    // same transfers on the calling thread
    TransferResult run_send(const sockaddr_in &local, const sockaddr_in &remote,
        const std::string &filename, const std::vector<TransferOption> &options,
        const CancelToken &cancelled = nullptr);
    TransferResult run_receive(const sockaddr_in &local, const sockaddr_in &remote,
        const std::string &filename, const std::vector<TransferOption> &options,
        const CancelToken &cancelled = nullptr);

private:
    WorkerConfig config;

    void check_config() const;
    std::unique_ptr<UDP> setup_socket(const sockaddr_in &local, const sockaddr_in &remote,
        std::chrono::milliseconds timeout);
    void report_file_error(const sockaddr_in &local, const sockaddr_in &remote,
        ErrorCode code, const std::string &msg);
};

#endif
