#ifndef XBRIDGE_ADAPTERS_AXELAR_HPP
#define XBRIDGE_ADAPTERS_AXELAR_HPP

#include <map>
#include <set>
#include <string>

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// AxelarAdapter - gateway callContract with native gas prepaid to the gas service
//
// Axelar names chains with strings, so config.domain_ids must be empty and the
// names are passed alongside config.chain_ids.
// =============================================================================

class AxelarAdapter : public BaseAdapter {
public:
    AxelarAdapter(Chain& chain, const Address& gateway, const Address& gas_service,
                  const AdapterConfig& config, const std::vector<std::string>& domain_names);

    // Executor entry point; the gateway must approve the call
    void execute(const Bytes32& command_id, const std::string& source_chain,
                 const std::string& source_address, const Bytes& payload);

    // DefaultAdmin
    void set_domain_id(const std::vector<std::string>& domain_names, const std::vector<ChainId>& chain_ids);

    bool is_chain_id_supported(ChainId chain_id) const override;
    std::vector<ChainId> supported_chain_ids() const override;

    const Address& gateway() const { return bridge(); }
    const Address& gas_service() const { return gas_service_; }

    std::optional<std::string> domain_name_for_chain(ChainId chain_id) const;
    std::optional<ChainId> chain_for_domain_name(const std::string& name) const;
    bool is_command_processed(const Bytes32& command_id) const;

protected:
    Address refund_address(const Bytes& options) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;

private:
    void associate_name(const std::string& name, ChainId chain_id);

    struct Names {
        std::map<std::string, ChainId> name_chains;
        std::map<ChainId, std::string> chain_names;
        std::set<Bytes32> processed;
    };

    Address gas_service_;
    Journaled<Names> names_;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_AXELAR_HPP
