#ifndef TRANSFER_HPP
#define TRANSFER_HPP
#include <atomic>
#include <cstdio>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"
#include "options.hpp"
#include "udp.hpp"

// Answer the request that started the transfer: OACK when options were
// negotiated, ACK 0 for a write request without options, nothing for a
// read request without options. Returns true if an OACK went out.
bool accept_request(UDP &udp, const NegotiatedParameters &params, const TransferDirection &direction);

// Stop-and-wait sender: one DATA block in flight, resent until its ACK
// arrives or max_retries attempts fail.
class BlockSender {
public:
    enum State {
        READING,
        SENDING,
        ADVANCING,
        ABORTED,
        DONE
    };

    BlockSender(UDP &udp, FILE *fp, const NegotiatedParameters &params,
        unsigned int max_retries, const std::atomic<bool> *cancelled, uint64_t &transferred,
        unsigned int &misses);

    // check the peer's first answer, it must be ACK 0
    void confirm();
    // send until the final short block is acknowledged
    void send_file();

    State get_state() const {
        return state;
    }

private:
    UDP &udp;
    FILE *fp;
    size_t block_size;
    unsigned int max_retries;
    const std::atomic<bool> *cancelled;
    uint64_t &transferred;
    unsigned int &misses;
    State state = READING;

    bool await_ack(uint16_t block_num);
    [[noreturn]] void fail(ErrorKind kind, const std::string &msg);
};

// Stop-and-wait receiver: accepts only the successor of the last block,
// acknowledges it, stops after the first short block.
class BlockReceiver {
public:
    enum State {
        RECEIVING,
        WRITING,
        ACKNOWLEDGING,
        ABORTED,
        DONE
    };

    BlockReceiver(UDP &udp, FILE *fp, const NegotiatedParameters &params,
        unsigned int max_retries, const std::atomic<bool> *cancelled, uint64_t &transferred,
        unsigned int &misses);

    void receive_file();

    State get_state() const {
        return state;
    }

private:
    UDP &udp;
    FILE *fp;
    size_t block_size;
    unsigned int max_retries;
    const std::atomic<bool> *cancelled;
    uint64_t &transferred;
    unsigned int &misses;
    State state = RECEIVING;
    // last accepted block, 0 before the first one
    uint16_t block_num = 0;
    bool accepted_any = false;

    std::optional<DataPacket> await_data();
    [[noreturn]] void fail(ErrorKind kind, const std::string &msg);
};

#endif
