#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace parbook {

enum class ErrorCode : std::uint8_t {
    InvalidAmount,     // zero base or quote amount on placement
    OrderNotFound,     // unknown id or non-active order on cancel
    Unauthorized,      // cancel by someone other than the owner
    InvalidBatchSize   // buy/sell id lists of different length
};

const char* to_string(ErrorCode code) noexcept;

// Rejection of a single book operation. The book state is untouched.
class BookError : public std::runtime_error {
public:
    BookError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    explicit BookError(ErrorCode code)
        : BookError(code, to_string(code)) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace parbook
