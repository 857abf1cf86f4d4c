#ifndef XBRIDGE_WRAPPER_HPP
#define XBRIDGE_WRAPPER_HPP

#include <map>
#include <set>
#include <utility>
#include <vector>

#include "access.hpp"
#include "chain.hpp"
#include "fee_math.hpp"
#include "token.hpp"

namespace xbridge {

// =============================================================================
// Transfer Parameters
// =============================================================================

struct TransferParams {
    Address controller;
    Address recipient;
    U128 amount = 0;
    bool unwrap = false;
    ChainId dest_chain_id = 0;
};

// Thresholds and rates as configured, in tier order
struct FeeTierSchedule {
    std::vector<U128> thresholds;
    std::vector<uint32_t> rates;
};

// =============================================================================
// ControllerWrapper - tiered fee gateway in front of whitelisted controllers
// =============================================================================

class ControllerWrapper : public Contract {
public:
    ControllerWrapper(Chain& chain, const Address& admin, const Address& manager, const Address& treasury,
                      uint32_t fee_rate, const std::vector<Address>& controllers,
                      const std::vector<ChainId>& premium_chain_ids, const std::vector<uint32_t>& premium_rates);

    // fee + net == amount
    FeeQuote quote(const Address& controller, ChainId dest_chain_id, U128 amount) const;

    // =========================================================================
    // Transfers (payable; msg.value is forwarded to the controller)
    // =========================================================================

    Bytes32 transfer_to(const TransferParams& params, const Address& adapter, const Bytes& options,
                        const Bytes& data);

    Bytes32 transfer_to(const TransferParams& params, const std::vector<Address>& adapters,
                        const std::vector<U128>& fees, const std::vector<Bytes>& options, const Bytes& data);

    // Runs the permit for params.amount before pulling funds
    Bytes32 transfer_to_with_permit(const TransferParams& params, const Permit& permit, const Address& adapter,
                                    const Bytes& options, const Bytes& data);

    Bytes32 transfer_to_with_permit(const TransferParams& params, const Permit& permit,
                                    const std::vector<Address>& adapters, const std::vector<U128>& fees,
                                    const std::vector<Bytes>& options, const Bytes& data);

    void resend_transfer(const Address& controller, const Bytes32& transfer_id, const Address& adapter,
                         const Bytes& options, const Bytes& data);

    void resend_transfer(const Address& controller, const Bytes32& transfer_id,
                         const std::vector<Address>& adapters, const std::vector<U128>& fees,
                         const std::vector<Bytes>& options, const Bytes& data);

    // =========================================================================
    // Admin or manager (Unauthorized otherwise)
    // =========================================================================

    void set_controllers(const std::vector<Address>& controllers, const std::vector<bool>& statuses);
    void set_fee_rate(uint32_t fee_rate);
    void set_dest_chain_premium_rate(const std::vector<ChainId>& chain_ids, const std::vector<uint32_t>& rates);
    void set_controller_fee_tiers(const Address& controller, const std::vector<ChainId>& dest_chain_ids,
                                  const std::vector<U128>& thresholds, const std::vector<uint32_t>& rates);

    // =========================================================================
    // Admin only
    // =========================================================================

    void set_treasury(const Address& treasury);
    void rescue_tokens(const Address& token, const Address& to, U128 amount);
    void rescue_eth(const Address& to, U128 amount);
    void pause();
    void unpause();

    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }

    // =========================================================================
    // Views
    // =========================================================================

    const Address& treasury() const { return state_->treasury; }
    uint32_t fee_rate() const { return state_->fee_rate; }
    uint32_t dest_chain_premium_rate(ChainId chain_id) const;
    bool is_controller(const Address& controller) const;
    bool paused() const { return pausable_.paused(); }
    FeeTierSchedule get_controller_fee_tiers(const Address& controller, ChainId dest_chain_id) const;

private:
    struct State {
        Address treasury{};
        uint32_t fee_rate = 0;
        std::set<Address> controllers;
        std::map<ChainId, uint32_t> premiums;
        std::map<std::pair<Address, ChainId>, FeeTierConfig> tiers;
    };

    void only_admin_or_manager() const;
    void require_controller(const Address& controller) const;
    void apply_premiums(const std::vector<ChainId>& chain_ids, const std::vector<uint32_t>& rates);

    // Pulls the gross amount, pays the fee and approves net to the controller
    U128 handle_transfers(const Address& payer, const TransferParams& params);
    void clear_approval(const TransferParams& params);

    void emit_sent(const Address& controller, bool is_resend, bool is_multi, U128 amount, U128 net,
                   const Bytes& data);

    AccessControl access_;
    Pausable pausable_;
    Journaled<State> state_;
};

} // namespace xbridge

#endif // XBRIDGE_WRAPPER_HPP
