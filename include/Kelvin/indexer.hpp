#ifndef KELVIN_INDEXER
#define KELVIN_INDEXER

#include <Kelvin/session.hpp>
#include <Kelvin/options.hpp>
#include <Kelvin/network/source.hpp>
#include <Kelvin/network/memo.hpp>

namespace Kelvin {

    // synchronizes a wallet cache with a remote indexer.
    struct indexer {
        tx_source &Source;
        tx_memo &Memo;
        sync_options Options;

        indexer (tx_source &s, tx_memo &m, const sync_options &o = {}) : Source {s}, Memo {m}, Options {o} {}

        // build a new cache by downloading the history of every address
        // until BatchSize unused addresses in a row are found for every keychain.
        may_error<wallet_cache> create (const descriptor &);

        // only download histories of addresses that have changed since they
        // were last downloaded. Returns the number of addresses that were updated.
        may_error<size_t> update (const descriptor &, wallet_cache &);

        broadcast_result publish (const Bitcoin::transaction &);

        // the complete history of an address, requested one page at a time.
        list<indexed_tx> fetch (const derived_address &);

    private:
        session scan (const descriptor &, wallet_cache &, bool update);

        // returns true if the address should count as unused.
        bool process_address (const derived_address &, wallet_cache &, session &, bool update);

        // true if the indexer reports no new activity for an address.
        bool unchanged (const derived_address &, session &);

        // try fetch as many times as we are allowed.
        maybe<list<indexed_tx>> download (const derived_address &, session &);
    };

}

#endif
