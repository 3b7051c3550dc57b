#ifndef KELVIN_SESSION
#define KELVIN_SESSION

#include <Kelvin/wallet/cache.hpp>
#include <Kelvin/error.hpp>

namespace Kelvin {

    // everything that was learned about the addresses of a
    // wallet during a single sync.
    struct session {

        struct visit {
            wallet_addr Address;
            // transactions that must be reconciled for this address.
            list<Bitcoin::TXID> TXIDs;
            // true if TXIDs is the whole history that the indexer reported
            // during this sync. Cached txs that touch this address but are
            // not in TXIDs have been dropped from the mempool.
            bool Complete;
        };

        // every address that was checked, by script hash.
        std::map<digest256, visit> Visited;

        list<error> Errors;

        // an address that we did not download.
        void add (const wallet_addr &);

        // an address and its complete history.
        void add (const wallet_addr &, list<Bitcoin::TXID>);

        // remove unconfirmed txs that are no longer reported by the indexer, then
        // resolve the parties of every visited transaction and update balances,
        // the unspent set, and address stats in the cache. All outputs are
        // processed before any input. Returns the number of addresses that
        // were changed.
        size_t reconcile (wallet_cache &, Bitcoin::net) const;
    };

}

#endif
