/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "csvcols/status.hpp"

namespace csvcols {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:              result = "OK"; break;
        case StatusCode::kNotFound:        result = "NotFound"; break;
        case StatusCode::kInvalidArgument: result = "InvalidArgument"; break;
        case StatusCode::kIOError:         result = "IOError"; break;
        case StatusCode::kNotSupported:    result = "NotSupported"; break;
        case StatusCode::kAborted:         result = "Aborted"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace csvcols
