#ifndef XBRIDGE_FEE_COLLECTOR_HPP
#define XBRIDGE_FEE_COLLECTOR_HPP

#include "access.hpp"
#include "chain.hpp"

namespace xbridge {

// =============================================================================
// FeeCollector - flat proportional fee paid in the bridged token
// =============================================================================

class FeeCollector : public Contract {
public:
    FeeCollector(Chain& chain, uint32_t fee_bps, const Address& treasury, const Address& owner);

    U128 quote(U128 amount) const;

    // Pulls quote(amount) of `token` from the caller into the treasury
    void collect(const Address& token, U128 amount);

    // Owner only
    void set_fee_bps(uint32_t fee_bps);
    void set_treasury(const Address& treasury);

    uint32_t fee_bps() const { return *fee_bps_; }
    const Address& treasury() const { return *treasury_; }
    const Address& owner() const { return ownable_.owner(); }

private:
    Ownable ownable_;
    Journaled<uint32_t> fee_bps_;
    Journaled<Address> treasury_;
};

} // namespace xbridge

#endif // XBRIDGE_FEE_COLLECTOR_HPP
