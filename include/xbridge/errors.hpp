#ifndef XBRIDGE_ERRORS_HPP
#define XBRIDGE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace xbridge {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Configuration
constexpr int32_t INVALID_PARAMS = -1;
constexpr int32_t LENGTH_MISMATCH = -2;
constexpr int32_t ZERO_ADDRESS = -3;
constexpr int32_t AMOUNT_ZERO = -4;
constexpr int32_t ABI_DECODE_ERROR = -5;
constexpr int32_t NOT_A_CONTRACT = -6;

// Authorization
constexpr int32_t UNAUTHORISED = -10;            // adapter inbound origin checks
constexpr int32_t UNAUTHORIZED = -11;            // wrapper admin/manager checks
constexpr int32_t MISSING_ROLE = -12;
constexpr int32_t OWNABLE_UNAUTHORIZED = -13;
constexpr int32_t PAUSED = -14;
constexpr int32_t NOT_PAUSED = -15;
constexpr int32_t REENTRANCY = -16;
constexpr int32_t CONTROLLER_NOT_WHITELISTED = -17;

// Value / fee
constexpr int32_t INSUFFICIENT_BALANCE = -20;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -21;
constexpr int32_t TRANSFER_FAILED = -22;
constexpr int32_t FEE_TRANSFER_FAILED = -23;
constexpr int32_t FEE_TOO_LOW = -24;
constexpr int32_t VALUE_IS_LESS_THAN_LIMIT = -25;
constexpr int32_t FEE_ON_TRANSFER_TOKEN_NOT_SUPPORTED = -26;
constexpr int32_t INVALID_FEE_RATE = -27;
constexpr int32_t FEE_EXCEEDS_MAX_BPS = -28;
constexpr int32_t TREASURY_ZERO_ADDRESS = -29;
constexpr int32_t MSG_VALUE_NOT_ZERO = -30;
constexpr int32_t PERMIT_EXPIRED = -31;
constexpr int32_t INVALID_SIGNATURE = -32;
constexpr int32_t NOT_BRIDGE = -33;

// Transport
constexpr int32_t ALREADY_PROCESSED = -40;
constexpr int32_t INVALID_PROOF = -41;
constexpr int32_t UNKNOWN_REFUND_CHAIN_ID = -42;
constexpr int32_t NOT_APPROVED_BY_GATEWAY = -43;
constexpr int32_t INVALID_ROUTER = -44;
constexpr int32_t ONLY_PEER = -45;
constexpr int32_t RELAY_DEPOSITORY_ZERO_ADDRESS = -46;
constexpr int32_t SPOKE_POOL_ZERO_ADDRESS = -47;

// Controller
constexpr int32_t CHAIN_NOT_SUPPORTED = -50;
constexpr int32_t TRANSFERS_PAUSED_TO_DESTINATION = -51;
constexpr int32_t NOT_HIGH_ENOUGH_LIMITS = -52;
constexpr int32_t TOKEN_BURN_FAILED = -53;
constexpr int32_t LIMITS_TOO_HIGH = -54;
constexpr int32_t MULTI_BRIDGE_TRANSFERS_DISABLED = -55;
constexpr int32_t FEES_SUM_MISMATCH = -56;
constexpr int32_t DUPLICATE_ADAPTER = -57;
constexpr int32_t ADAPTER_NOT_SUPPORTED = -58;
constexpr int32_t UNKNOWN_TRANSFER = -59;
constexpr int32_t TRANSFER_NOT_EXECUTABLE = -60;
constexpr int32_t TRANSFER_RESENT_BY_ADAPTER = -61;
constexpr int32_t THRESHOLD_NOT_MET = -62;
constexpr int32_t NOT_ENOUGH_TOKENS_IN_POOL = -63;
constexpr int32_t UNWRAPPING_NOT_SUPPORTED = -64;

// Registry
constexpr int32_t NOT_ADAPTER = -70;
}

// Symbolic name for a code, "Unknown" for anything unlisted
const char* error_name(int32_t code);

// =============================================================================
// Revert
// =============================================================================

// Thrown by every contract entry point; the enclosing transaction rolls back
class Revert : public std::runtime_error {
public:
    Revert(int32_t code, const std::string& detail);

    int32_t code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    int32_t code_;
    std::string detail_;
};

[[noreturn]] void revert(int32_t code, const std::string& detail = {});

inline void require(bool condition, int32_t code, const char* detail = "") {
    if (!condition) revert(code, detail);
}

} // namespace xbridge

#endif // XBRIDGE_ERRORS_HPP
