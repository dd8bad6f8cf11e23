#include "utils.hpp"
#include "protocol.hpp"
#include "udp.hpp"
#include "worker.hpp"
#include "errors.hpp"
#include <getopt.h>
#include <cstdlib>
#include <iostream>

static void usage(const char *prog) {
    std::cerr << "Usage: " << prog << " (--send | --receive) --file <file> --remote <ip> --port <port>"
        << " [--local <ip>] [--blksize <n>] [--tsize <n>] [--timeout <s>] [--retries <n>] [--wait <ms>] [--verify <file>]" << std::endl;
}

// Serve one transfer to a peer whose request was already accepted elsewhere
int main(int argc, char *argv[]) {
    std::string direction;
    std::string file;
    std::string local_ip = "0.0.0.0";
    std::string remote_ip;
    std::string verify;
    int remote_port = 0;
    std::vector<TransferOption> options;
    WorkerConfig config;

    struct option long_options[] = {
        {"send", no_argument, 0, 'S'},
        {"receive", no_argument, 0, 'R'},
        {"file", required_argument, 0, 'f'},
        {"local", required_argument, 0, 'l'},
        {"remote", required_argument, 0, 'r'},
        {"port", required_argument, 0, 'p'},
        {"blksize", required_argument, 0, 'b'},
        {"tsize", required_argument, 0, 's'},
        {"timeout", required_argument, 0, 't'},
        {"retries", required_argument, 0, 'n'},
        {"wait", required_argument, 0, 'w'},
        {"verify", required_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "SRf:l:r:p:b:s:t:n:w:v:", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'S':
                direction = "send";
                break;
            case 'R':
                direction = "receive";
                break;
            case 'f':
                file = optarg;
                break;
            case 'l':
                local_ip = optarg;
                break;
            case 'r':
                remote_ip = optarg;
                break;
            case 'p':
                remote_port = std::atoi(optarg);
                break;
            case 'b':
                options.push_back({OptionType::BlockSize, std::strtoull(optarg, nullptr, 10)});
                break;
            case 's':
                options.push_back({OptionType::TransferSize, std::strtoull(optarg, nullptr, 10)});
                break;
            case 't':
                options.push_back({OptionType::Timeout, std::strtoull(optarg, nullptr, 10)});
                break;
            case 'n':
                config.max_retries = static_cast<unsigned int>(std::atoi(optarg));
                break;
            case 'w':
                config.timeout = std::chrono::milliseconds(std::atoi(optarg));
                break;
            case 'v':
                verify = optarg;
                break;
            default:
                usage(argv[0]);
                return 1;
        }
    }

    if (direction.empty() || file.empty() || remote_ip.empty() || remote_port <= 0) {
        std::cerr << "Error: Missing required arguments." << std::endl;
        usage(argv[0]);
        return 1;
    }
    if (config.max_retries == 0 || config.timeout.count() <= 0) {
        std::cerr << "Error: --retries and --wait must be positive." << std::endl;
        return 1;
    }

    sockaddr_in local;
    sockaddr_in remote;
    try {
        local = make_addr(local_ip.c_str(), 0);
        remote = make_addr(remote_ip.c_str(), remote_port);
    } catch (const TransferError &e) {
        err(e.what());
        return 1;
    }

    log(("Worker: " + direction + " " + file + " with " + addr_str(remote)).c_str());

    Worker worker(config);
    TransferHandle handle = direction == "send"
        ? worker.start_send(local, remote, file, options)
        : worker.start_receive(local, remote, file, options);
    TransferResult result = handle.join();

    if (!result.ok) {
        err(("Worker: " + std::string(error_kind_name(result.kind)) + " after "
            + std::to_string(result.bytes_transferred) + " Bytes").c_str());
        return 1;
    }

    // compare the transferred file against a reference copy
    if (!verify.empty()) {
        if (!compare_files(file.c_str(), verify.c_str())) {
            err(("Worker: " + file + " differs from " + verify).c_str());
            return 1;
        }
        log(("Worker: " + file + " matches " + verify).c_str());
    }
    return 0;
}
