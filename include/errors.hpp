#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    InvalidOption,   // negotiation rejected a requested option
    FileAccess,      // local file could not be opened, read or written
    PeerError,       // peer sent an ERROR packet
    TimedOut,        // retries exhausted on a single block
    IllegalResponse, // peer answered the OACK with a non-zero ACK
    Socket,          // socket setup or send failed
    Cancelled
};

const char *error_kind_name(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

#endif
