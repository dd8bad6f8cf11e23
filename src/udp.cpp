#include "udp.hpp"
#include "errors.hpp"
#include <sys/time.h>
#include <vector>

static TransferError socket_error(const char *where) {
    return TransferError(ErrorKind::Socket, std::string(where) + ": " + strerror(errno));
}

sockaddr_in make_addr(const char *ip, int port) {
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip, &addr.sin_addr) <= 0) {
        throw TransferError(ErrorKind::Socket, std::string("Error converting ip address ") + ip);
    }
    return addr;
}

std::string addr_str(const sockaddr_in &addr) {
    char ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip, INET_ADDRSTRLEN);
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

UDP::UDP(const sockaddr_in &bind_addr) : addr(bind_addr) {
    memset(&remote, 0, sizeof(remote));
    // create socket
    sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        throw socket_error("UDP::UDP(): Error creating socket");
    }
    // bind addr
    if (bind(sock, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        TransferError e = socket_error("UDP::UDP(): Error binding socket");
        close(sock);
        throw e;
    }
    socklen_t len = sizeof(addr);
    getsockname(sock, (struct sockaddr *)&addr, &len);
}

UDP::~UDP() {
    close(sock);
}

void UDP::connect(const sockaddr_in &peer_addr) {
    if (::connect(sock, (const struct sockaddr *)&peer_addr, sizeof(peer_addr)) < 0) {
        throw socket_error("UDP::connect(): Error connecting socket");
    }
    remote = peer_addr;
    connected = true;
}

void UDP::set_timeout(std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;
    if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        throw socket_error("UDP::set_timeout(): Error setting read timeout");
    }
    if (setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw socket_error("UDP::set_timeout(): Error setting write timeout");
    }
}

int UDP::local_port() const {
    return ntohs(addr.sin_port);
}

void UDP::send_packet(const Packet &packet) {
    if (!connected) {
        throw TransferError(ErrorKind::Socket, "UDP::send_packet(): Not connected");
    }
    std::vector<uint8_t> buf = encode(packet);
    packets_sent++;
    if (send(sock, buf.data(), buf.size(), 0) < 0) {
        throw socket_error("UDP::send_packet(): Error sending packet");
    }
    debug(get_debug_str("UDP::send_packet(): Sent packet", packet).c_str());
}

std::optional<Packet> UDP::recv_into(uint8_t *buffer, size_t size, sockaddr_in *from) {
    sockaddr_in src;
    socklen_t addr_len = sizeof(src);
    // MSG_TRUNC reports the real datagram length even if it did not fit
    ssize_t ret = recvfrom(sock, buffer, size, MSG_TRUNC, (struct sockaddr *)&src, &addr_len);
    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        if (errno == ECONNREFUSED) {
            // ICMP port unreachable from an earlier send
            debug("UDP::recv_packet(): Connection refused");
            return std::nullopt;
        }
        throw socket_error("UDP::recv_packet(): Error receiving packet");
    }
    packets_recv++;
    if (static_cast<size_t>(ret) > size) {
        throw MalformedPacket("packet too large (" + std::to_string(ret) + " bytes)");
    }
    if (from != nullptr) {
        *from = src;
    }
    Packet packet = decode(buffer, static_cast<size_t>(ret));
    debug(get_debug_str("UDP::recv_packet(): Recv packet", packet).c_str());
    return packet;
}

std::optional<Packet> UDP::recv_packet(sockaddr_in *from) {
    std::vector<uint8_t> buffer(BUF_SIZE);
    return recv_into(buffer.data(), buffer.size(), from);
}

std::optional<Packet> UDP::recv_data(size_t max_len) {
    std::vector<uint8_t> buffer(HEADER_SIZE + max_len);
    return recv_into(buffer.data(), buffer.size(), nullptr);
}

void UDP::send_ack(uint16_t block_num) {
    AckPacket ack;
    ack.block_num = block_num;
    send_packet(ack);
}

void UDP::send_data(uint16_t block_num, const uint8_t *data, size_t len) {
    DataPacket packet;
    packet.block_num = block_num;
    packet.payload.assign(data, data + len);
    send_packet(packet);
}

void UDP::send_error(ErrorCode code, const std::string &msg) {
    ErrorPacket error;
    error.code = code;
    error.message = msg;
    send_packet(error);
}

void UDP::send_oack(const std::vector<TransferOption> &options) {
    OptionAckPacket oack;
    oack.options = options;
    send_packet(oack);
}
