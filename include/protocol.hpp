#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// TFTP packets (RFC 1350, options per RFC 2347/2348/2349), all integers big endian
//
//  RRQ/WRQ  | Opcode (16) | Filename | 0 | Mode | 0 | Opt1 | 0 | Value1 | 0 | ...
//  DATA     | Opcode (16) | Block (16) | Payload (0..blksize)
//  ACK      | Opcode (16) | Block (16)
//  ERROR    | Opcode (16) | ErrorCode (16) | ErrMsg | 0
//  OACK     | Opcode (16) | Opt1 | 0 | Value1 | 0 | ...

const uint16_t OPCODE_RRQ = 1;
const uint16_t OPCODE_WRQ = 2;
const uint16_t OPCODE_DATA = 3;
const uint16_t OPCODE_ACK = 4;
const uint16_t OPCODE_ERROR = 5;
const uint16_t OPCODE_OACK = 6;

const size_t HEADER_SIZE = 4;
const size_t DEFAULT_BLOCK_SIZE = 512;
const size_t MIN_BLOCK_SIZE = 8;
const size_t MAX_BLOCK_SIZE = 65464;
const uint64_t MAX_TIMEOUT_SECS = 255;

enum class ErrorCode : uint16_t {
    Undefined = 0,
    FileNotFound = 1,
    AccessViolation = 2,
    DiskFull = 3,
    IllegalOperation = 4,
    UnknownTransferId = 5,
    FileAlreadyExists = 6,
    NoSuchUser = 7,
    OptionNegotiationFailed = 8
};

enum class OptionType {
    BlockSize,
    TransferSize,
    Timeout
};

struct TransferOption {
    OptionType kind;
    uint64_t value;

    bool operator==(const TransferOption &rhs) const {
        return kind == rhs.kind && value == rhs.value;
    }
    bool operator!=(const TransferOption &rhs) const {
        return !(*this == rhs);
    }
};

struct RequestPacket {
    enum Kind { READ, WRITE };
    Kind kind = READ;
    std::string filename;
    std::string mode = "octet";
    std::vector<TransferOption> options;

    bool operator==(const RequestPacket &rhs) const {
        return kind == rhs.kind && filename == rhs.filename
            && mode == rhs.mode && options == rhs.options;
    }
    bool operator!=(const RequestPacket &rhs) const {
        return !(*this == rhs);
    }
};

struct DataPacket {
    uint16_t block_num = 0;
    std::vector<uint8_t> payload;

    bool operator==(const DataPacket &rhs) const {
        return block_num == rhs.block_num && payload == rhs.payload;
    }
    bool operator!=(const DataPacket &rhs) const {
        return !(*this == rhs);
    }
};

struct AckPacket {
    uint16_t block_num = 0;

    bool operator==(const AckPacket &rhs) const {
        return block_num == rhs.block_num;
    }
    bool operator!=(const AckPacket &rhs) const {
        return !(*this == rhs);
    }
};

struct ErrorPacket {
    ErrorCode code = ErrorCode::Undefined;
    std::string message;

    bool operator==(const ErrorPacket &rhs) const {
        return code == rhs.code && message == rhs.message;
    }
    bool operator!=(const ErrorPacket &rhs) const {
        return !(*this == rhs);
    }
};

struct OptionAckPacket {
    std::vector<TransferOption> options;

    bool operator==(const OptionAckPacket &rhs) const {
        return options == rhs.options;
    }
    bool operator!=(const OptionAckPacket &rhs) const {
        return !(*this == rhs);
    }
};

typedef std::variant<RequestPacket, DataPacket, AckPacket, ErrorPacket, OptionAckPacket> Packet;

// visitor helper for std::visit over Packet
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

class MalformedPacket : public std::runtime_error {
public:
    explicit MalformedPacket(const std::string &what) : std::runtime_error(what) {}
};

// encode packet into wire bytes
std::vector<uint8_t> encode(const Packet &packet);
// decode wire bytes, throws MalformedPacket
Packet decode(const uint8_t *buf, size_t len);
Packet decode(const std::vector<uint8_t> &buf);

// wire name of an option ("blksize", "tsize", "timeout")
const char *option_name(OptionType kind);
// numeric error code as carried on the wire
uint16_t error_code_value(ErrorCode code);

// successor block number, wraps 65535 -> 0
inline uint16_t next_block(uint16_t block_num) {
    return static_cast<uint16_t>(block_num + 1);
}
#endif
