#ifndef XBRIDGE_XBRIDGE_HPP
#define XBRIDGE_XBRIDGE_HPP

// =============================================================================
// xbridge - cross-chain token transfer stack
//
//   Chain / Contract       execution environment with journaled state
//   BaseAdapter + 8        transport adapters behind one relay interface
//   AssetController        burn/mint (or lock/release) transfers, multi-bridge
//   ControllerWrapper      tiered fee gateway in front of controllers
//   Relay / Across         flat fee wrappers for deposit endpoints
//   Registry               local adapter book
//
// =============================================================================

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "abi.hpp"
#include "hash.hpp"
#include "chain.hpp"
#include "access.hpp"
#include "token.hpp"
#include "fee_math.hpp"
#include "fee_collector.hpp"
#include "message.hpp"
#include "bridges.hpp"
#include "adapter.hpp"
#include "adapters/axelar.hpp"
#include "adapters/ccip.hpp"
#include "adapters/connext.hpp"
#include "adapters/hyperlane.hpp"
#include "adapters/layerzero.hpp"
#include "adapters/optimism.hpp"
#include "adapters/polymer.hpp"
#include "adapters/wormhole.hpp"
#include "controller.hpp"
#include "wrapper.hpp"
#include "deposit_wrapper.hpp"
#include "registry.hpp"
#include "config.hpp"

#endif // XBRIDGE_XBRIDGE_HPP
