// =============================================================================
// errors.cpp - Error Names and Revert
// =============================================================================

#include "xbridge/errors.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::INVALID_PARAMS: return "InvalidParams";
        case errors::LENGTH_MISMATCH: return "LengthMismatch";
        case errors::ZERO_ADDRESS: return "ZeroAddress";
        case errors::AMOUNT_ZERO: return "AmountZero";
        case errors::ABI_DECODE_ERROR: return "AbiDecodeError";
        case errors::NOT_A_CONTRACT: return "NotAContract";
        case errors::UNAUTHORISED: return "Unauthorised";
        case errors::UNAUTHORIZED: return "Unauthorized";
        case errors::MISSING_ROLE: return "AccessControlUnauthorizedAccount";
        case errors::OWNABLE_UNAUTHORIZED: return "OwnableUnauthorizedAccount";
        case errors::PAUSED: return "EnforcedPause";
        case errors::NOT_PAUSED: return "ExpectedPause";
        case errors::REENTRANCY: return "ReentrancyGuardReentrantCall";
        case errors::CONTROLLER_NOT_WHITELISTED: return "ControllerNotWhitelisted";
        case errors::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case errors::INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case errors::TRANSFER_FAILED: return "TransferFailed";
        case errors::FEE_TRANSFER_FAILED: return "FeeTransferFailed";
        case errors::FEE_TOO_LOW: return "FeeTooLow";
        case errors::VALUE_IS_LESS_THAN_LIMIT: return "ValueIsLessThanLimit";
        case errors::FEE_ON_TRANSFER_TOKEN_NOT_SUPPORTED: return "FeeOnTransferTokenNotSupported";
        case errors::INVALID_FEE_RATE: return "InvalidFeeRate";
        case errors::FEE_EXCEEDS_MAX_BPS: return "FeeExceedsMaxBps";
        case errors::TREASURY_ZERO_ADDRESS: return "TreasuryZeroAddress";
        case errors::MSG_VALUE_NOT_ZERO: return "MsgValueNotZero";
        case errors::PERMIT_EXPIRED: return "PermitExpired";
        case errors::INVALID_SIGNATURE: return "InvalidSignature";
        case errors::NOT_BRIDGE: return "NotBridge";
        case errors::ALREADY_PROCESSED: return "AlreadyProcessed";
        case errors::INVALID_PROOF: return "InvalidProof";
        case errors::UNKNOWN_REFUND_CHAIN_ID: return "UnknownRefundChainId";
        case errors::NOT_APPROVED_BY_GATEWAY: return "NotApprovedByGateway";
        case errors::INVALID_ROUTER: return "InvalidRouter";
        case errors::ONLY_PEER: return "OnlyPeer";
        case errors::RELAY_DEPOSITORY_ZERO_ADDRESS: return "RelayDepositoryZeroAddress";
        case errors::SPOKE_POOL_ZERO_ADDRESS: return "SpokePoolZeroAddress";
        case errors::CHAIN_NOT_SUPPORTED: return "ChainNotSupported";
        case errors::TRANSFERS_PAUSED_TO_DESTINATION: return "TransfersPausedToDestination";
        case errors::NOT_HIGH_ENOUGH_LIMITS: return "NotHighEnoughLimits";
        case errors::TOKEN_BURN_FAILED: return "TokenBurnFailed";
        case errors::LIMITS_TOO_HIGH: return "LimitsTooHigh";
        case errors::MULTI_BRIDGE_TRANSFERS_DISABLED: return "MultiBridgeTransfersDisabled";
        case errors::FEES_SUM_MISMATCH: return "FeesSumMismatch";
        case errors::DUPLICATE_ADAPTER: return "DuplicateAdapter";
        case errors::ADAPTER_NOT_SUPPORTED: return "AdapterNotSupported";
        case errors::UNKNOWN_TRANSFER: return "UnknownTransfer";
        case errors::TRANSFER_NOT_EXECUTABLE: return "TransferNotExecutable";
        case errors::TRANSFER_RESENT_BY_ADAPTER: return "TransferResentByAdapter";
        case errors::THRESHOLD_NOT_MET: return "ThresholdNotMet";
        case errors::NOT_ENOUGH_TOKENS_IN_POOL: return "NotEnoughTokensInPool";
        case errors::UNWRAPPING_NOT_SUPPORTED: return "UnwrappingNotSupported";
        case errors::NOT_ADAPTER: return "NotAdapter";
        default: return "Unknown";
    }
}

namespace {

std::string format_message(int32_t code, const std::string& detail) {
    std::string msg = error_name(code);
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

} // namespace

Revert::Revert(int32_t code, const std::string& detail)
    : std::runtime_error(format_message(code, detail))
    , code_(code)
    , detail_(detail) {}

void revert(int32_t code, const std::string& detail) {
    XB_DEBUG("revert " << error_name(code) << (detail.empty() ? "" : " (" + detail + ")"));
    throw Revert(code, detail);
}

} // namespace xbridge
