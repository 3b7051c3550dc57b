#include <Kelvin/indexer.hpp>

namespace Kelvin {

    list<indexed_tx> indexer::fetch (const derived_address &d) {
        list<indexed_tx> txs;
        maybe<Bitcoin::TXID> last_seen;

        while (true) {
            list<indexed_tx> page = Source.transactions (d, last_seen);
            txs = txs + page;

            // a short page is the last one.
            if (data::empty (page) || page.size () < Options.PageSize) break;

            for (const indexed_tx &tx : page) last_seen = tx.TXID;
        }

        return txs;
    }

    maybe<list<indexed_tx>> indexer::download (const derived_address &d, session &s) {
        uint32 attempts = Options.FetchAttempts == 0 ? 1 : Options.FetchAttempts;

        maybe<list<indexed_tx>> history;
        for (uint32 attempt = 1; attempt <= attempts; attempt++) {
            try {
                history = fetch (d);
                break;
            } catch (const std::exception &x) {
                if (Options.Verbose) std::cout << "attempt " << attempt << " to get history of " << d << " failed: " << x.what () << std::endl;
                if (attempt == attempts) s.Errors <<= error {error::fetch, std::string {"could not get history of address "} +
                    static_cast<const std::string &> (d.Address) + ": " + x.what ()};
            }
        }

        // if we could not get the history we count the address as unused.
        if (bool (history)) Memo.put (d, *history);
        return history;
    }

}
