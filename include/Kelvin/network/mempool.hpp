#ifndef KELVIN_NETWORK_MEMPOOL
#define KELVIN_NETWORK_MEMPOOL

#include <Kelvin/network/esplora.hpp>

namespace Kelvin {

    // mempool.space has the same API as Esplora except that
    // histories are looked up by address rather than script hash.
    struct mempool final : esplora {
        using esplora::esplora;

        // https://mempool.space/api
        static mempool space (ptr<net::HTTP::SSL> ssl) {
            return mempool {ssl, "mempool.space"};
        }

        list<indexed_tx> transactions (const derived_address &, const maybe<Bitcoin::TXID> &last_seen) final override;
    };

}

#endif
