#include "protocol.hpp"
#include <cctype>
#include <cstring>
#include <limits>

static void put_u16(std::vector<uint8_t> &buf, uint16_t val) {
    buf.push_back(static_cast<uint8_t>(val >> 8));
    buf.push_back(static_cast<uint8_t>(val & 0xff));
}

static uint16_t get_u16(const uint8_t *buf) {
    return static_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

static void put_str(std::vector<uint8_t> &buf, const std::string &str) {
    buf.insert(buf.end(), str.begin(), str.end());
    buf.push_back('\0');
}

static void put_options(std::vector<uint8_t> &buf, const std::vector<TransferOption> &options) {
    for (const auto &option : options) {
        put_str(buf, option_name(option.kind));
        put_str(buf, std::to_string(option.value));
    }
}

// read a NUL terminated string starting at pos, advance pos past the NUL
static std::string take_str(const uint8_t *buf, size_t len, size_t &pos) {
    const void *end = memchr(buf + pos, '\0', len - pos);
    if (end == nullptr) {
        throw MalformedPacket("missing string terminator");
    }
    size_t str_len = static_cast<const uint8_t *>(end) - (buf + pos);
    std::string ret(reinterpret_cast<const char *>(buf + pos), str_len);
    pos += str_len + 1;
    return ret;
}

static std::string lower(std::string str) {
    for (char &c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

static uint64_t parse_value(const std::string &str) {
    if (str.empty() || str.size() > 20) {
        throw MalformedPacket("invalid option value '" + str + "'");
    }
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            throw MalformedPacket("invalid option value '" + str + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw MalformedPacket("option value out of range '" + str + "'");
        }
        value = value * 10 + digit;
    }
    return value;
}

// option pairs run until the end of the packet, unknown names are skipped
static std::vector<TransferOption> take_options(const uint8_t *buf, size_t len, size_t pos) {
    std::vector<TransferOption> options;
    while (pos < len) {
        std::string name = lower(take_str(buf, len, pos));
        if (pos >= len) {
            throw MalformedPacket("option '" + name + "' has no value");
        }
        std::string value = take_str(buf, len, pos);
        if (name == "blksize") {
            options.push_back({OptionType::BlockSize, parse_value(value)});
        } else if (name == "tsize") {
            options.push_back({OptionType::TransferSize, parse_value(value)});
        } else if (name == "timeout") {
            options.push_back({OptionType::Timeout, parse_value(value)});
        }
    }
    return options;
}

const char *option_name(OptionType kind) {
    switch (kind) {
        case OptionType::BlockSize:
            return "blksize";
        case OptionType::TransferSize:
            return "tsize";
        case OptionType::Timeout:
            return "timeout";
    }
    return "unknown";
}

uint16_t error_code_value(ErrorCode code) {
    return static_cast<uint16_t>(code);
}

std::vector<uint8_t> encode(const Packet &packet) {
    std::vector<uint8_t> buf;
    std::visit(overloaded {
        [&buf](const RequestPacket &req) {
            put_u16(buf, req.kind == RequestPacket::READ ? OPCODE_RRQ : OPCODE_WRQ);
            put_str(buf, req.filename);
            put_str(buf, req.mode);
            put_options(buf, req.options);
        },
        [&buf](const DataPacket &data) {
            buf.reserve(HEADER_SIZE + data.payload.size());
            put_u16(buf, OPCODE_DATA);
            put_u16(buf, data.block_num);
            buf.insert(buf.end(), data.payload.begin(), data.payload.end());
        },
        [&buf](const AckPacket &ack) {
            put_u16(buf, OPCODE_ACK);
            put_u16(buf, ack.block_num);
        },
        [&buf](const ErrorPacket &error) {
            put_u16(buf, OPCODE_ERROR);
            put_u16(buf, error_code_value(error.code));
            put_str(buf, error.message);
        },
        [&buf](const OptionAckPacket &oack) {
            put_u16(buf, OPCODE_OACK);
            put_options(buf, oack.options);
        }
    }, packet);
    return buf;
}

Packet decode(const uint8_t *buf, size_t len) {
    if (len < 2) {
        throw MalformedPacket("packet too small");
    }
    uint16_t opcode = get_u16(buf);
    switch (opcode) {
        case OPCODE_RRQ:
        case OPCODE_WRQ: {
            RequestPacket req;
            req.kind = opcode == OPCODE_RRQ ? RequestPacket::READ : RequestPacket::WRITE;
            size_t pos = 2;
            req.filename = take_str(buf, len, pos);
            if (pos >= len) {
                throw MalformedPacket("request has no mode");
            }
            req.mode = take_str(buf, len, pos);
            req.options = take_options(buf, len, pos);
            return req;
        }
        case OPCODE_DATA: {
            if (len < HEADER_SIZE) {
                throw MalformedPacket("data packet too small");
            }
            DataPacket data;
            data.block_num = get_u16(buf + 2);
            data.payload.assign(buf + HEADER_SIZE, buf + len);
            return data;
        }
        case OPCODE_ACK: {
            if (len != HEADER_SIZE) {
                throw MalformedPacket("ack packet size mismatch");
            }
            AckPacket ack;
            ack.block_num = get_u16(buf + 2);
            return ack;
        }
        case OPCODE_ERROR: {
            if (len < HEADER_SIZE + 1) {
                throw MalformedPacket("error packet too small");
            }
            ErrorPacket error;
            uint16_t code = get_u16(buf + 2);
            error.code = code <= error_code_value(ErrorCode::OptionNegotiationFailed)
                ? static_cast<ErrorCode>(code) : ErrorCode::Undefined;
            size_t pos = HEADER_SIZE;
            error.message = take_str(buf, len, pos);
            return error;
        }
        case OPCODE_OACK: {
            OptionAckPacket oack;
            oack.options = take_options(buf, len, 2);
            return oack;
        }
        default:
            throw MalformedPacket("unknown opcode " + std::to_string(opcode));
    }
}

Packet decode(const std::vector<uint8_t> &buf) {
    return decode(buf.data(), buf.size());
}
