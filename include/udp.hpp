#ifndef UDP_HPP
#define UDP_HPP
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <optional>
#include <string>
#include "protocol.hpp"
#include "utils.hpp"

// largest datagram accepted when the negotiated block size is not yet known
static const unsigned int BUF_SIZE = 65536;

// resolve dotted ip and port, throws TransferError(Socket)
sockaddr_in make_addr(const char *ip, int port);
// "ip:port"
std::string addr_str(const sockaddr_in &addr);

// One datagram socket carrying whole TFTP packets. Every call is a single
// blocking operation bounded by the deadline given to set_timeout().
class UDP {
public:
    // bind to addr, port 0 picks an ephemeral port
    explicit UDP(const sockaddr_in &addr);
    ~UDP();
    UDP(const UDP &) = delete;
    UDP &operator=(const UDP &) = delete;

    // filter to a single peer, all sends go there
    void connect(const sockaddr_in &remote);
    // read and write deadline
    void set_timeout(std::chrono::milliseconds timeout);

    int local_port() const;
    const sockaddr_in &peer() const { return remote; }

    void send_packet(const Packet &packet);
    // nullopt on timeout, throws MalformedPacket on undecodable datagrams
    std::optional<Packet> recv_packet(sockaddr_in *from = nullptr);
    // as recv_packet, but datagrams carrying more than max_len payload bytes are rejected
    std::optional<Packet> recv_data(size_t max_len);

    void send_ack(uint16_t block_num);
    void send_data(uint16_t block_num, const uint8_t *data, size_t len);
    void send_error(ErrorCode code, const std::string &msg);
    void send_oack(const std::vector<TransferOption> &options);

    unsigned int packets_sent = 0;
    unsigned int packets_recv = 0;
private:
    int sock;
    struct sockaddr_in addr;
    struct sockaddr_in remote;
    bool connected = false;

    std::optional<Packet> recv_into(uint8_t *buffer, size_t size, sockaddr_in *from);
};

#endif
