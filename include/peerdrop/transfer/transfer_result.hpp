#pragma once

#include <string>

namespace peerdrop::transfer {

enum class TransferError {
    SUCCESS = 0,
    PROTOCOL_VIOLATION,
    CHANNEL_FAILURE,
    SIZE_MISMATCH,
    SOURCE_READ_ERROR,
    TIMEOUT,
    INVALID_STATE
};

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

inline const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::PROTOCOL_VIOLATION: return "protocol violation";
        case TransferError::CHANNEL_FAILURE: return "channel failure";
        case TransferError::SIZE_MISMATCH: return "size mismatch";
        case TransferError::SOURCE_READ_ERROR: return "source read error";
        case TransferError::TIMEOUT: return "timeout";
        case TransferError::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

}
