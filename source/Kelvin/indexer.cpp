#include <Kelvin/indexer.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    may_error<wallet_cache> indexer::create (const descriptor &d) {
        wallet_cache cache {};
        session s = scan (d, cache, false);
        s.reconcile (cache, d.network ());
        return may_error<wallet_cache> {cache, s.Errors};
    }

    may_error<size_t> indexer::update (const descriptor &d, wallet_cache &cache) {
        session s = scan (d, cache, true);
        size_t updated = s.reconcile (cache, d.network ());
        if (Options.Verbose) std::cout << "updated " << updated << " addresses" << std::endl;
        return may_error<size_t> {updated, s.Errors};
    }

    broadcast_result indexer::publish (const Bitcoin::transaction &tx) {
        if (Options.Verbose) std::cout << "publishing tx " << write (tx.id ()) << std::endl;
        broadcast_result result = Source.broadcast (bytes (tx));
        if (Options.Verbose) std::cout << "broadcast result: " << result << std::endl;
        return result;
    }

    session indexer::scan (const descriptor &d, wallet_cache &cache, bool update) {
        session s {};

        for (keychain k : d.keychains ()) {
            if (Options.Verbose) std::cout << "checking keychain " << k << std::endl;

            uint32 unused = 0;
            for (address_sequence seq = d.addresses (k); true; seq = seq.next ()) {
                if (!process_address (seq.last (), cache, s, update)) unused = 0;
                else if (++unused >= Options.BatchSize) break;
            }
        }

        return s;
    }

    bool indexer::unchanged (const derived_address &d, session &s) {
        address_stats known = Memo.stats (d);

        try {
            address_stats reported = Source.stats (d.Address);
            return reported.empty () || reported == known;
        } catch (const std::exception &x) {
            if (Options.Verbose) std::cout << "could not get stats for address " << d << ": " << x.what () << std::endl;
            s.Errors <<= error {error::stats, std::string {"could not get stats for address "} +
                static_cast<const std::string &> (d.Address) + ": " + x.what ()};
        }

        // we can't tell, so we check.
        return false;
    }

    bool indexer::process_address (const derived_address &d, wallet_cache &cache, session &s, bool update) {

        if (update && unchanged (d, s)) {
            const wallet_addr *known = cache.address (d.Terminal);
            if (known == nullptr) return true;
            s.add (*known);
            return false;
        }

        maybe<list<indexed_tx>> history = update ? maybe<list<indexed_tx>> {} : Memo.get (d);
        if (!bool (history)) history = download (d, s);

        if (!bool (history)) {
            s.add (wallet_addr {d});
            return true;
        }

        if (data::empty (*history)) {
            s.add (wallet_addr {d}, {});
            return true;
        }

        if (Options.Verbose) std::cout << "found " << history->size () << " txs for address " << d << std::endl;

        list<Bitcoin::TXID> txids;
        std::map<Bitcoin::TXID, wallet_tx> staged;

        // nothing is written to the cache unless the whole history is good.
        try {
            for (const indexed_tx &tx : *history) {
                if (staged.contains (tx.TXID)) continue;
                txids <<= tx.TXID;

                wallet_tx fresh {tx};
                auto stored = cache.Transactions.find (tx.TXID);
                if (stored == cache.Transactions.end ()) staged.emplace (tx.TXID, fresh);
                else staged.emplace (tx.TXID, stored->second).first->second.merge (fresh);
            }
        } catch (const exception &x) {
            s.Errors <<= error {error::invalid_response, std::string {"invalid history for address "} +
                static_cast<const std::string &> (d.Address) + ": " + x.what ()};
            s.add (wallet_addr {d});
            return true;
        }

        for (const auto &[txid, tx] : staged) cache.Transactions[txid] = tx;

        s.add (wallet_addr {d}, txids);
        return false;
    }

}
