#include "worker.hpp"
#include "options.hpp"
#include "transfer.hpp"
#include "utils.hpp"
#include <sys/stat.h>

typedef std::unique_ptr<FILE, int (*)(FILE *)> FilePtr;

TransferHandle::TransferHandle(std::future<TransferResult> result, CancelToken cancelled)
    : result(std::move(result)), cancelled(std::move(cancelled)) {
}

TransferResult TransferHandle::join() {
    if (!finished) {
        finished = result.get();
    }
    return *finished;
}

void TransferHandle::cancel() {
    if (cancelled) {
        cancelled->store(true);
    }
}

bool TransferHandle::done() const {
    return finished.has_value()
        || result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

Worker::Worker(const WorkerConfig &config) : config(config) {
}

std::unique_ptr<UDP> Worker::setup_socket(const sockaddr_in &local, const sockaddr_in &remote,
    std::chrono::milliseconds timeout) {
    // new transfer ID: local port 0 picks an ephemeral one
    std::unique_ptr<UDP> udp = std::make_unique<UDP>(local);
    udp->connect(remote);
    udp->set_timeout(timeout);
    debug(("Worker::setup_socket(): " + addr_str(local) + " port " + std::to_string(udp->local_port())
        + " -> " + addr_str(remote)).c_str());
    return udp;
}

// tell the peer why the transfer cannot start, the local failure is reported by the caller
void Worker::report_file_error(const sockaddr_in &local, const sockaddr_in &remote,
    ErrorCode code, const std::string &msg) {
    try {
        std::unique_ptr<UDP> udp = setup_socket(local, remote, config.timeout);
        udp->send_error(code, msg);
    } catch (const TransferError &e) {
        err(("Worker: Could not report file error to " + addr_str(remote) + ": " + e.what()).c_str());
    }
}

// a zero retry bound or deadline would let a transfer wait forever
void Worker::check_config() const {
    if (config.max_retries == 0) {
        throw TransferError(ErrorKind::InvalidOption, "Invalid retry count 0");
    }
    if (config.timeout.count() <= 0) {
        throw TransferError(ErrorKind::InvalidOption,
            "Invalid timeout " + std::to_string(config.timeout.count()) + " ms");
    }
}

static TransferResult finish(const char *verb, const char *dir, const std::string &filename,
    const sockaddr_in &remote, uint64_t bytes, unsigned int misses,
    std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log((std::string(verb) + " " + filename + " " + dir + " " + addr_str(remote) + ": "
        + std::to_string(bytes) + " Bytes in "
        + std::to_string((float)elapsed.count() / 1000.0) + " s, "
        + std::to_string(misses) + " missed").c_str());
    TransferResult result;
    result.ok = true;
    result.bytes_transferred = bytes;
    result.misses = misses;
    return result;
}

static TransferResult failure(const TransferError &e, uint64_t bytes, unsigned int misses) {
    err(e.what());
    TransferResult result;
    result.kind = e.kind();
    result.message = e.what();
    result.bytes_transferred = bytes;
    result.misses = misses;
    return result;
}

TransferResult Worker::run_send(const sockaddr_in &local, const sockaddr_in &remote,
    const std::string &filename, const std::vector<TransferOption> &options,
    const CancelToken &cancelled) {
    auto start = std::chrono::steady_clock::now();
    uint64_t transferred = 0;
    unsigned int misses = 0;
    try {
        check_config();
        FilePtr fp(fopen(filename.c_str(), "rb"), fclose);
        if (!fp) {
            int e = errno;
            report_file_error(local, remote,
                e == EACCES ? ErrorCode::AccessViolation : ErrorCode::FileNotFound,
                e == EACCES ? "Access violation" : "File not found");
            throw TransferError(ErrorKind::FileAccess, "Error opening file " + filename + ": " + strerror(e));
        }
        struct stat st;
        if (fstat(fileno(fp.get()), &st) < 0) {
            throw TransferError(ErrorKind::FileAccess, "Error reading size of " + filename + ": " + strerror(errno));
        }

        // negotiate before any I/O so the OACK carries the real size
        TransferDirection direction = TransferDirection::send(static_cast<uint64_t>(st.st_size));
        NegotiatedParameters params = negotiate(options, direction, config.timeout);

        std::unique_ptr<UDP> udp = setup_socket(local, remote, params.timeout);
        BlockSender sender(*udp, fp.get(), params, config.max_retries, cancelled.get(), transferred, misses);
        accept_request(*udp, params, direction);
        // ACK 0 answers our OACK, or the read request when nothing was negotiated
        sender.confirm();
        sender.send_file();
        return finish("Sent", "to", filename, remote, transferred, misses, start);
    } catch (const TransferError &e) {
        return failure(e, transferred, misses);
    }
}

TransferResult Worker::run_receive(const sockaddr_in &local, const sockaddr_in &remote,
    const std::string &filename, const std::vector<TransferOption> &options,
    const CancelToken &cancelled) {
    auto start = std::chrono::steady_clock::now();
    uint64_t transferred = 0;
    unsigned int misses = 0;
    try {
        check_config();
        TransferDirection direction = TransferDirection::receive();
        NegotiatedParameters params = negotiate(options, direction, config.timeout);

        FilePtr fp(fopen(filename.c_str(), "wb"), fclose);
        if (!fp) {
            int e = errno;
            report_file_error(local, remote, ErrorCode::AccessViolation, "Access violation");
            throw TransferError(ErrorKind::FileAccess, "Error creating file " + filename + ": " + strerror(e));
        }

        std::unique_ptr<UDP> udp = setup_socket(local, remote, params.timeout);
        BlockReceiver receiver(*udp, fp.get(), params, config.max_retries, cancelled.get(), transferred, misses);
        accept_request(*udp, params, direction);
        receiver.receive_file();
        return finish("Received", "from", filename, remote, transferred, misses, start);
    } catch (const TransferError &e) {
        return failure(e, transferred, misses);
    }
}

TransferHandle Worker::start_send(const sockaddr_in &local, const sockaddr_in &remote,
    const std::string &filename, const std::vector<TransferOption> &options) {
    CancelToken cancelled = std::make_shared<std::atomic<bool>>(false);
    WorkerConfig cfg = config;
    std::future<TransferResult> result = std::async(std::launch::async,
        [cfg, local, remote, filename, options, cancelled]() {
            return Worker(cfg).run_send(local, remote, filename, options, cancelled);
        });
    return TransferHandle(std::move(result), cancelled);
}

TransferHandle Worker::start_receive(const sockaddr_in &local, const sockaddr_in &remote,
    const std::string &filename, const std::vector<TransferOption> &options) {
    CancelToken cancelled = std::make_shared<std::atomic<bool>>(false);
    WorkerConfig cfg = config;
    std::future<TransferResult> result = std::async(std::launch::async,
        [cfg, local, remote, filename, options, cancelled]() {
            return Worker(cfg).run_receive(local, remote, filename, options, cancelled);
        });
    return TransferHandle(std::move(result), cancelled);
}
