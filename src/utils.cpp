#include "utils.hpp"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
// #define DEBUG

// format "[hh:mm:ss.uuuuuu]" of the current wall clock time
static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    struct tm parts;
    localtime_r(&now_c, &parts);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    char buf[32];
    snprintf(buf, sizeof(buf), "[%02d:%02d:%02d.%06ld]", parts.tm_hour, parts.tm_min, parts.tm_sec, static_cast<long>(microseconds));
    return buf;
}

// print log with green color, time(us) and [LOG] prefix
void log(const char *msg) {
    printf("\033[32m%s [LOG] %s\033[0m\n", timestamp().c_str(), msg);
}

// print error with red color, time and [ERR] prefix to stderr
void err(const char *msg) {
    fprintf(stderr, "\033[31m%s [ERR] %s\033[0m\n", timestamp().c_str(), msg);
}

// print debug info with time and [DBG] prefix
void debug(const char *msg) {
    #ifdef DEBUG
    printf("%s [DBG] %s\n", timestamp().c_str(), msg);
    #else
    (void)msg;
    #endif
}

static std::string options_str(const std::vector<TransferOption> &options) {
    std::string ret;
    for (const auto &option : options) {
        ret += " ";
        ret += option_name(option.kind);
        ret += "=";
        ret += std::to_string(option.value);
    }
    return ret;
}

// get debug string of packet
// in format "prefix DAT blk=xxx len=xxx" / "prefix ACK blk=xxx" / "prefix ERR code=xxx msg=xxx" ...
std::string get_debug_str(const char *prefix, const Packet &packet) {
    std::string ret = prefix;
    std::visit(overloaded {
        [&ret](const RequestPacket &req) {
            ret += req.kind == RequestPacket::READ ? " RRQ " : " WRQ ";
            ret += req.filename;
            ret += " ";
            ret += req.mode;
            ret += options_str(req.options);
        },
        [&ret](const DataPacket &data) {
            ret += " DAT blk=";
            ret += std::to_string(data.block_num);
            ret += " len=";
            ret += std::to_string(data.payload.size());
        },
        [&ret](const AckPacket &ack) {
            ret += " ACK blk=";
            ret += std::to_string(ack.block_num);
        },
        [&ret](const ErrorPacket &error) {
            ret += " ERR code=";
            ret += std::to_string(error_code_value(error.code));
            ret += " msg=";
            ret += error.message;
        },
        [&ret](const OptionAckPacket &oack) {
            ret += " OACK";
            ret += options_str(oack.options);
        }
    }, packet);
    return ret;
}

bool compare_files(const char *file1, const char *file2) {
    std::ifstream f1(file1, std::ios::binary | std::ios::ate);
    std::ifstream f2(file2, std::ios::binary | std::ios::ate);

    if (f1.fail() || f2.fail()) {
        return false;
    }

    if (f1.tellg() != f2.tellg()) {
        return false;
    }

    f1.seekg(0, std::ios::beg);
    f2.seekg(0, std::ios::beg);

    return std::equal(std::istreambuf_iterator<char>(f1.rdbuf()),
        std::istreambuf_iterator<char>(),
        std::istreambuf_iterator<char>(f2.rdbuf()));
}
