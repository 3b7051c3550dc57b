#ifndef KELVIN_TEST_MOCK
#define KELVIN_TEST_MOCK

#include <Kelvin/indexer.hpp>
#include <Kelvin/write.hpp>
#include <iomanip>

namespace Kelvin::test {

    // a digest that is easy to recognize when it is printed.
    digest160 inline make_digest (uint32 a, uint32 b) {
        std::stringstream ss;
        ss << "0x" << std::hex << std::setfill ('0') << std::setw (8) << a << std::setw (8) << b << std::string (24, '0');
        return digest160 {ss.str ()};
    }

    Bitcoin::TXID inline make_txid (uint32 n) {
        std::stringstream ss;
        ss << std::hex << std::setfill ('0') << std::setw (64) << n;
        return read_TXID (ss.str ());
    }

    derived_address inline wallet_address (keychain k, uint32 i) {
        digest160 d = make_digest (k + 1, i);
        return derived_address {terminal {k, i}, Bitcoin::address {Bitcoin::address::main, d}, pay_to_address::script (d)};
    }

    // an address that does not belong to the wallet.
    derived_address inline other_address (uint32 i) {
        digest160 d = make_digest (0xffff, i);
        return derived_address {terminal {0xffff, i}, Bitcoin::address {Bitcoin::address::main, d}, pay_to_address::script (d)};
    }

    struct test_descriptor final : descriptor {
        std::set<keychain> Keychains {0, 1};

        test_descriptor () {}
        test_descriptor (std::set<keychain> k) : Keychains {k} {}

        std::set<keychain> keychains () const final override {
            return Keychains;
        }

        derived_address derive (keychain k, uint32 index) const final override {
            return wallet_address (k, index);
        }

        Bitcoin::net network () const final override {
            return Bitcoin::net::Main;
        }
    };

    indexed_tx::output inline pay (const derived_address &to, int64 value) {
        return indexed_tx::output {to.Script, Bitcoin::satoshi {value}};
    }

    indexed_tx::input inline spend (const indexed_tx &prev, uint32 index) {
        uint32 i = 0;
        for (const indexed_tx::output &out : prev.Outputs)
            if (i++ == index) return indexed_tx::input {
                Bitcoin::outpoint {prev.TXID, index},
                indexed_tx::prevout {out.Script, out.Value},
                bytes {}, {}, false, 0xffffffff};
        throw exception {} << "no output " << index;
    }

    // spend an output of a transaction we don't know about.
    indexed_tx::input inline spend_other (uint32 n, const derived_address &from, int64 value) {
        return indexed_tx::input {
            Bitcoin::outpoint {make_txid (n), 0},
            indexed_tx::prevout {from.Script, Bitcoin::satoshi {value}},
            bytes {}, {}, false, 0xffffffff};
    }

    indexed_tx::input inline coinbase () {
        return indexed_tx::input {Bitcoin::outpoint {Bitcoin::TXID {}, 0xffffffff}, {}, bytes {}, {}, true, 0xffffffff};
    }

    indexed_tx inline make_tx (uint32 n, list<indexed_tx::input> in, list<indexed_tx::output> out, maybe<uint32> height = {}) {
        indexed_tx tx;
        tx.TXID = make_txid (n);
        tx.Inputs = in;
        tx.Outputs = out;
        tx.Size = 200;
        tx.Weight = 800;
        tx.Fee = Bitcoin::satoshi {1000};
        if (bool (height)) tx.Status = indexed_tx::status {*height, make_txid (0xb10c0000 + *height), 1700000000 + *height};
        return tx;
    }

    // an indexer that keeps everything in memory and counts the calls made to it.
    struct test_source final : tx_source {
        uint32 PageSize {sync_options::DefaultPageSize};

        // histories by address in the order they were added.
        std::map<Bitcoin::address, list<indexed_tx>> Histories;

        // addresses for which every call fails.
        std::set<Bitcoin::address> Failing;

        // number of calls that will fail for an address before it succeeds.
        std::map<Bitcoin::address, uint32> Transient;

        bool StatsFail {false};

        // what broadcast returns.
        broadcast_result Response {};

        std::map<Bitcoin::address, uint32> Calls;
        uint32 TransactionCalls {0};
        uint32 StatsCalls {0};
        list<bytes> Broadcast;

        // add a tx to the history of every address that it touches.
        void add (const indexed_tx &tx) {
            std::set<Bitcoin::address> touched;
            auto touch = [&] (const bytes &script) {
                pay_to_address p {script};
                if (p.valid ()) touched.insert (Bitcoin::address {Bitcoin::address::main, p.Address});
            };

            for (const indexed_tx::input &in : tx.Inputs) if (bool (in.Prevout)) touch (in.Prevout->Script);
            for (const indexed_tx::output &out : tx.Outputs) touch (out.Script);

            for (const Bitcoin::address &a : touched) Histories[a] <<= tx;
        }

        // replace a tx that has already been added, such as when it is mined.
        void replace (const indexed_tx &tx) {
            for (auto &[a, history] : Histories) {
                list<indexed_tx> updated;
                for (const indexed_tx &old : history) updated <<= (old.TXID == tx.TXID ? tx : old);
                history = updated;
            }
        }

        // remove a tx everywhere, such as when it is dropped from the mempool.
        void remove (const Bitcoin::TXID &txid) {
            for (auto &[a, history] : Histories) {
                list<indexed_tx> updated;
                for (const indexed_tx &old : history) if (old.TXID != txid) updated <<= old;
                history = updated;
            }
        }

        list<indexed_tx> history (const Bitcoin::address &a) const {
            auto h = Histories.find (a);
            return h == Histories.end () ? list<indexed_tx> {} : h->second;
        }

        list<indexed_tx> transactions (const derived_address &d, const maybe<Bitcoin::TXID> &last_seen) final override {
            TransactionCalls++;
            Calls[d.Address]++;

            if (Failing.contains (d.Address)) throw exception {} << "connection refused";

            auto t = Transient.find (d.Address);
            if (t != Transient.end () && t->second > 0) {
                t->second--;
                throw exception {} << "connection reset";
            }

            list<indexed_tx> page;
            bool started = !bool (last_seen);
            for (const indexed_tx &tx : history (d.Address)) {
                if (page.size () == PageSize) break;
                if (started) page <<= tx;
                else if (tx.TXID == *last_seen) started = true;
            }

            return page;
        }

        address_stats stats (const Bitcoin::address &a) final override {
            StatsCalls++;
            if (StatsFail) throw exception {} << "service unavailable";
            return address_stats {static_cast<const std::string &> (a), history (a)};
        }

        broadcast_result broadcast (const bytes &tx) final override {
            Broadcast <<= tx;
            return Response;
        }

        uint32 calls (const derived_address &d) const {
            auto c = Calls.find (d.Address);
            return c == Calls.end () ? 0 : c->second;
        }
    };

    sync_options inline quiet () {
        sync_options o {};
        o.Verbose = false;
        return o;
    }

    int64 inline value (const Bitcoin::satoshi &x) {
        return int64 (x);
    }

}

#endif
