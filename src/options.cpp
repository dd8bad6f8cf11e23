#include "options.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <string>

// a repeated option replaces the earlier value in place
static void acknowledge(std::vector<TransferOption> &acknowledged, const TransferOption &option) {
    for (auto &existing : acknowledged) {
        if (existing.kind == option.kind) {
            existing.value = option.value;
            return;
        }
    }
    acknowledged.push_back(option);
}

NegotiatedParameters negotiate(const std::vector<TransferOption> &requested,
    const TransferDirection &direction, std::chrono::milliseconds default_timeout) {
    NegotiatedParameters params;
    params.timeout = default_timeout;

    for (const auto &option : requested) {
        switch (option.kind) {
            case OptionType::BlockSize:
                if (option.value < MIN_BLOCK_SIZE || option.value > MAX_BLOCK_SIZE) {
                    throw TransferError(ErrorKind::InvalidOption,
                        "Invalid blksize value " + std::to_string(option.value));
                }
                params.block_size = static_cast<size_t>(option.value);
                acknowledge(params.acknowledged, option);
                break;
            case OptionType::TransferSize:
                if (direction.is_send()) {
                    // the peer learns the size actually being sent
                    params.transfer_size = direction.total_bytes;
                    acknowledge(params.acknowledged, {OptionType::TransferSize, direction.total_bytes});
                } else {
                    params.transfer_size = option.value;
                    acknowledge(params.acknowledged, option);
                }
                break;
            case OptionType::Timeout:
                if (option.value == 0 || option.value > MAX_TIMEOUT_SECS) {
                    throw TransferError(ErrorKind::InvalidOption,
                        "Invalid timeout value " + std::to_string(option.value));
                }
                params.timeout = std::chrono::seconds(option.value);
                acknowledge(params.acknowledged, option);
                break;
            default:
                debug(("negotiate(): ignoring option kind " + std::to_string(static_cast<int>(option.kind))).c_str());
                break;
        }
    }

    return params;
}
