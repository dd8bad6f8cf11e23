#include "transfer.hpp"
#include <utility>

bool accept_request(UDP &udp, const NegotiatedParameters &params, const TransferDirection &direction) {
    if (!params.acknowledged.empty()) {
        udp.send_oack(params.acknowledged);
        return true;
    }
    if (!direction.is_send()) {
        udp.send_ack(0);
    }
    return false;
}

static std::string peer_error_str(const ErrorPacket &error) {
    return "Received error code " + std::to_string(error_code_value(error.code)) + ": " + error.message;
}

static std::string timed_out_str(unsigned int tries) {
    return "Transfer timed out after " + std::to_string(tries) + " tries";
}

BlockSender::BlockSender(UDP &udp, FILE *fp, const NegotiatedParameters &params,
    unsigned int max_retries, const std::atomic<bool> *cancelled, uint64_t &transferred,
    unsigned int &misses)
    : udp(udp), fp(fp), block_size(params.block_size), max_retries(max_retries),
      cancelled(cancelled), transferred(transferred), misses(misses) {
}

void BlockSender::fail(ErrorKind kind, const std::string &msg) {
    state = ABORTED;
    throw TransferError(kind, msg);
}

void BlockSender::confirm() {
    std::optional<Packet> packet;
    try {
        packet = udp.recv_packet();
    } catch (const MalformedPacket &e) {
        fail(ErrorKind::IllegalResponse, std::string("Malformed initial response: ") + e.what());
    }
    if (!packet) {
        fail(ErrorKind::TimedOut, "No response to transfer acceptance");
    }
    std::visit(overloaded {
        [this](const AckPacket &ack) {
            if (ack.block_num != 0) {
                udp.send_error(ErrorCode::IllegalOperation, "invalid oack response");
                fail(ErrorKind::IllegalResponse,
                    "Invalid oack response, ack for block " + std::to_string(ack.block_num));
            }
        },
        [this](const ErrorPacket &error) {
            fail(ErrorKind::PeerError, peer_error_str(error));
        },
        [](const RequestPacket &) {},
        [](const DataPacket &) {},
        [](const OptionAckPacket &) {}
    }, *packet);
}

// true once the ACK for block_num arrives, false on timeout or anything else
bool BlockSender::await_ack(uint16_t block_num) {
    std::optional<Packet> packet;
    try {
        packet = udp.recv_packet();
    } catch (const MalformedPacket &e) {
        debug((std::string("BlockSender::await_ack(): ") + e.what()).c_str());
        return false;
    }
    if (!packet) {
        debug(("BlockSender::await_ack(): Timeout on block " + std::to_string(block_num)).c_str());
        return false;
    }
    return std::visit(overloaded {
        [block_num](const AckPacket &ack) {
            return ack.block_num == block_num;
        },
        [this](const ErrorPacket &error) -> bool {
            fail(ErrorKind::PeerError, peer_error_str(error));
        },
        [](const RequestPacket &) { return false; },
        [](const DataPacket &) { return false; },
        [](const OptionAckPacket &) { return false; }
    }, *packet);
}

void BlockSender::send_file() {
    std::vector<uint8_t> chunk(block_size);
    uint16_t block_num = 1;

    while (true) {
        state = READING;
        size_t size = fread(chunk.data(), 1, block_size, fp);
        if (ferror(fp)) {
            fail(ErrorKind::FileAccess, std::string("Error reading file: ") + strerror(errno));
        }

        unsigned int retries = 0;
        while (true) {
            if (cancelled != nullptr && cancelled->load()) {
                fail(ErrorKind::Cancelled, "Transfer cancelled");
            }
            state = SENDING;
            udp.send_data(block_num, chunk.data(), size);
            if (await_ack(block_num)) {
                break;
            }
            misses++;
            if (++retries >= max_retries) {
                fail(ErrorKind::TimedOut, timed_out_str(max_retries));
            }
        }

        state = ADVANCING;
        transferred += size;
        block_num = next_block(block_num);
        if (size < block_size) {
            break;
        }
    }
    state = DONE;
}

BlockReceiver::BlockReceiver(UDP &udp, FILE *fp, const NegotiatedParameters &params,
    unsigned int max_retries, const std::atomic<bool> *cancelled, uint64_t &transferred,
    unsigned int &misses)
    : udp(udp), fp(fp), block_size(params.block_size), max_retries(max_retries),
      cancelled(cancelled), transferred(transferred), misses(misses) {
}

void BlockReceiver::fail(ErrorKind kind, const std::string &msg) {
    state = ABORTED;
    throw TransferError(kind, msg);
}

// the successor of block_num, or nullopt on timeout, stale or foreign packets
std::optional<DataPacket> BlockReceiver::await_data() {
    std::optional<Packet> packet;
    try {
        packet = udp.recv_data(block_size);
    } catch (const MalformedPacket &e) {
        debug((std::string("BlockReceiver::await_data(): ") + e.what()).c_str());
        return std::nullopt;
    }
    if (!packet) {
        debug(("BlockReceiver::await_data(): Timeout waiting for block " + std::to_string(next_block(block_num))).c_str());
        return std::nullopt;
    }
    return std::visit(overloaded {
        [this](DataPacket &data) -> std::optional<DataPacket> {
            if (data.block_num == next_block(block_num)) {
                return std::move(data);
            }
            if (accepted_any && data.block_num == block_num) {
                // our ACK was lost, the sender is repeating the block
                udp.send_ack(block_num);
            }
            debug(("BlockReceiver::await_data(): Discard block " + std::to_string(data.block_num)).c_str());
            return std::nullopt;
        },
        [this](ErrorPacket &error) -> std::optional<DataPacket> {
            fail(ErrorKind::PeerError, peer_error_str(error));
        },
        [](RequestPacket &) -> std::optional<DataPacket> { return std::nullopt; },
        [](AckPacket &) -> std::optional<DataPacket> { return std::nullopt; },
        [](OptionAckPacket &) -> std::optional<DataPacket> { return std::nullopt; }
    }, *packet);
}

void BlockReceiver::receive_file() {
    while (true) {
        std::optional<DataPacket> data;
        unsigned int retries = 0;
        while (true) {
            if (cancelled != nullptr && cancelled->load()) {
                fail(ErrorKind::Cancelled, "Transfer cancelled");
            }
            state = RECEIVING;
            data = await_data();
            if (data) {
                break;
            }
            misses++;
            if (++retries >= max_retries) {
                fail(ErrorKind::TimedOut, timed_out_str(max_retries));
            }
        }

        state = WRITING;
        size_t size = data->payload.size();
        // flushed before the ACK so a full disk is reported for this block
        if (size > 0 && (fwrite(data->payload.data(), 1, size, fp) != size || fflush(fp) != 0)) {
            std::string reason = strerror(errno);
            udp.send_error(ErrorCode::DiskFull, "Disk full or allocation exceeded");
            fail(ErrorKind::FileAccess, "Error writing file: " + reason);
        }
        block_num = data->block_num;
        accepted_any = true;
        transferred += size;

        state = ACKNOWLEDGING;
        udp.send_ack(block_num);
        if (size < block_size) {
            break;
        }
    }
    state = DONE;
}
