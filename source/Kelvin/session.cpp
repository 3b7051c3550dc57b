#include <Kelvin/session.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    void session::add (const wallet_addr &a) {
        Visited[Gigamonkey::SHA2_256 (a.Script)] = visit {a, {}, false};
    }

    void session::add (const wallet_addr &a, list<Bitcoin::TXID> txids) {
        Visited[Gigamonkey::SHA2_256 (a.Script)] = visit {a, txids, true};
    }

    namespace {

        // owners of all scripts that belong to the wallet.
        struct owners {
            std::map<digest256, party> Owners;
            Bitcoin::net Net;

            owners (const std::map<digest256, session::visit> &visited, Bitcoin::net n) : Owners {}, Net {n} {
                for (const auto &[hash, v] : visited) Owners[hash] = v.Address.owner ();
            }

            // an address from the wallet if we know about it, otherwise whatever
            // address the script pays to. If the script is not pay to address,
            // it remains unknown.
            party operator () (const bytes &script) const {
                auto o = Owners.find (Gigamonkey::SHA2_256 (script));
                if (o != Owners.end ()) return o->second;

                pay_to_address p {script};
                if (p.valid ()) return party::external (Bitcoin::address {address_type (Net), p.Address}, script);

                return party::unknown (script);
            }
        };

        wallet_tx &stored (wallet_cache &cache, const Bitcoin::TXID &txid) {
            auto tx = cache.Transactions.find (txid);
            if (tx == cache.Transactions.end ()) throw exception {} << "tx " << write (txid) << " was visited but not stored";
            return tx->second;
        }

        // unconfirmed txs that touch an address whose history was downloaded
        // but which are not in that history, along with any unconfirmed txs
        // that spend their outputs.
        std::set<Bitcoin::TXID> evicted (const wallet_cache &cache, const std::map<digest256, session::visit> &visited) {
            std::map<digest256, std::set<Bitcoin::TXID>> complete;
            std::set<Bitcoin::TXID> current;
            for (const auto &[hash, v] : visited) {
                if (!v.Complete) continue;
                std::set<Bitcoin::TXID> &history = complete[hash];
                for (const Bitcoin::TXID &txid : v.TXIDs) {
                    history.insert (txid);
                    current.insert (txid);
                }
            }

            auto missing = [&complete] (const Bitcoin::TXID &txid, const party &p) -> bool {
                maybe<bytes> script = p.script ();
                if (!bool (script)) return false;
                auto c = complete.find (Gigamonkey::SHA2_256 (*script));
                return c != complete.end () && !c->second.contains (txid);
            };

            std::set<Bitcoin::TXID> gone;
            for (const auto &[txid, tx] : cache.Transactions) {
                if (tx.Status.mined () || current.contains (txid)) continue;
                for (const tx_credit &credit : tx.Inputs) if (missing (txid, credit.Payer)) gone.insert (txid);
                for (const tx_debit &debit : tx.Outputs) if (missing (txid, debit.Beneficiary)) gone.insert (txid);
            }

            for (bool more = !gone.empty (); more;) {
                more = false;
                for (const auto &[txid, tx] : cache.Transactions) {
                    if (tx.Status.mined () || current.contains (txid) || gone.contains (txid)) continue;
                    for (const tx_credit &credit : tx.Inputs) if (gone.contains (credit.Outpoint.Digest)) {
                        gone.insert (txid);
                        more = true;
                        break;
                    }
                }
            }

            return gone;
        }

        // remove txs from the cache along with their outputs and the spent
        // links that point to them.
        void forget (wallet_cache &cache, const std::set<Bitcoin::TXID> &gone) {
            for (const Bitcoin::TXID &txid : gone) {
                const wallet_tx &tx = stored (cache, txid);
                for (const tx_debit &debit : tx.Outputs) cache.Unspent.erase (debit.Outpoint);

                uint32 index = 0;
                for (const tx_credit &credit : tx.Inputs) {
                    inpoint spender {txid, index++};
                    auto prev = cache.Transactions.find (credit.Outpoint.Digest);
                    if (prev == cache.Transactions.end () || credit.Outpoint.Index >= prev->second.Outputs.size ()) continue;

                    tx_debit &redeemed = prev->second.Outputs[credit.Outpoint.Index];
                    if (bool (redeemed.Spent) && *redeemed.Spent == spender) redeemed.Spent = {};
                }
            }

            for (const Bitcoin::TXID &txid : gone) cache.Transactions.erase (txid);
        }

        void process_outputs (const owners &resolve, wallet_addr &stats, wallet_tx &tx, wallet_cache &cache) {
            for (tx_debit &debit : tx.Outputs) {
                maybe<bytes> script = debit.Beneficiary.script ();
                if (!bool (script)) continue;

                if (*script == stats.Script) {
                    debit.Beneficiary.resolve (stats.owner ());
                    if (!cache.spent (debit)) cache.Unspent.insert (debit.Outpoint);
                    stats.Used++;
                    stats.Volume += debit.Value;
                    stats.Balance += debit.Value;
                } else if (debit.Beneficiary.is_unknown ()) debit.Beneficiary.resolve (resolve (*script));
            }
        }

        void process_inputs (const owners &resolve, wallet_addr &stats, wallet_tx &tx, wallet_cache &cache) {
            uint32 index = 0;
            for (tx_credit &credit : tx.Inputs) {
                inpoint spender {tx.TXID, index++};

                maybe<bytes> script = credit.Payer.script ();
                if (!bool (script)) continue;

                if (*script == stats.Script) {
                    credit.Payer.resolve (stats.owner ());
                    stats.Balance -= credit.Value;
                } else if (credit.Payer.is_unknown ()) credit.Payer.resolve (resolve (*script));

                // we may not have the previous tx, in which case there is nothing to link.
                auto prev = cache.Transactions.find (credit.Outpoint.Digest);
                if (prev == cache.Transactions.end () || credit.Outpoint.Index >= prev->second.Outputs.size ()) continue;

                tx_debit &redeemed = prev->second.Outputs[credit.Outpoint.Index];
                redeemed.Spent = spender;
                if (tx.Status.mined ()) cache.Unspent.erase (redeemed.Outpoint);
            }
        }
    }

    size_t session::reconcile (wallet_cache &cache, Bitcoin::net net) const {
        forget (cache, evicted (cache, Visited));

        owners resolve {Visited, net};

        // new stats for every address that has something to reconcile. An address
        // whose history is now empty is no longer used.
        size_t cleared = 0;
        std::map<digest256, wallet_addr> updated;
        for (const auto &[hash, v] : Visited)
            if (!data::empty (v.TXIDs)) updated[hash] = wallet_addr {derived_address {v.Address.Terminal, v.Address.Address, v.Address.Script}};
            else if (v.Complete) {
                auto k = cache.Addresses.find (v.Address.Terminal.Keychain);
                if (k == cache.Addresses.end ()) continue;
                cleared += k->second.erase (v.Address.Terminal.Index);
                if (k->second.empty ()) cache.Addresses.erase (k);
            }

        // all outputs must be known before we look at any input because
        // an input may redeem an output found under a different address.
        for (auto &[hash, stats] : updated)
            for (const Bitcoin::TXID &txid : Visited.at (hash).TXIDs)
                process_outputs (resolve, stats, stored (cache, txid), cache);

        for (auto &[hash, stats] : updated)
            for (const Bitcoin::TXID &txid : Visited.at (hash).TXIDs)
                process_inputs (resolve, stats, stored (cache, txid), cache);

        for (const auto &[hash, stats] : updated)
            cache.Addresses[stats.Terminal.Keychain][stats.Terminal.Index] = stats;

        return updated.size () + cleared;
    }

}
