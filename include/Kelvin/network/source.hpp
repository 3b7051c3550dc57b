#ifndef KELVIN_NETWORK_SOURCE
#define KELVIN_NETWORK_SOURCE

#include <Kelvin/network/indexed.hpp>
#include <Kelvin/network/broadcast.hpp>
#include <Kelvin/wallet/descriptor.hpp>

namespace Kelvin {

    // a remote service that knows the history of addresses. The
    // methods throw if the service cannot be reached or responds
    // with something we don't understand.
    struct tx_source {
        // one page of transactions that pay to or redeem from the given address,
        // continuing after last_seen if provided.
        virtual list<indexed_tx> transactions (const derived_address &, const maybe<Bitcoin::TXID> &last_seen) = 0;

        virtual address_stats stats (const Bitcoin::address &) = 0;

        virtual broadcast_result broadcast (const bytes &tx) = 0;

        virtual ~tx_source () {}
    };

}

#endif
