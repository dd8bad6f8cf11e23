#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstdint>
#include <vector>
#include "protocol.hpp"

// which side of the transfer this worker plays
struct TransferDirection {
    enum Kind { SEND, RECEIVE };
    Kind kind;
    // local file length, only meaningful when sending
    uint64_t total_bytes;

    static TransferDirection send(uint64_t total_bytes) {
        return TransferDirection{SEND, total_bytes};
    }
    static TransferDirection receive() {
        return TransferDirection{RECEIVE, 0};
    }
    bool is_send() const { return kind == SEND; }
};

struct NegotiatedParameters {
    size_t block_size = DEFAULT_BLOCK_SIZE;
    // informational only, never used to pre-allocate
    uint64_t transfer_size = 0;
    std::chrono::milliseconds timeout{5000};
    // option values to echo back in the OACK, in request order
    std::vector<TransferOption> acknowledged;
};

// resolve requested options into transfer parameters.
// throws TransferError(InvalidOption) for a zero timeout or an unusable block size
NegotiatedParameters negotiate(const std::vector<TransferOption> &requested,
    const TransferDirection &direction, std::chrono::milliseconds default_timeout);

#endif
