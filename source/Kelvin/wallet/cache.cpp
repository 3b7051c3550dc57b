#include <Kelvin/wallet/cache.hpp>

namespace Kelvin {

    std::ostream &operator << (std::ostream &o, const wallet_addr &a) {
        return o << a.Terminal << "\t" << static_cast<const std::string &> (a.Address) << "\t" <<
            a.Used << "\t" << a.Volume << "\t" << a.Balance;
    }

    const wallet_addr *wallet_cache::address (const Kelvin::terminal &t) const {
        auto k = Addresses.find (t.Keychain);
        if (k == Addresses.end ()) return nullptr;
        auto a = k->second.find (t.Index);
        if (a == k->second.end ()) return nullptr;
        return &a->second;
    }

    const tx_debit *wallet_cache::output (const Bitcoin::outpoint &op) const {
        auto tx = Transactions.find (op.Digest);
        if (tx == Transactions.end () || op.Index >= tx->second.Outputs.size ()) return nullptr;
        return &tx->second.Outputs[op.Index];
    }

    bool wallet_cache::spent (const tx_debit &d) const {
        if (!bool (d.Spent)) return false;
        auto tx = Transactions.find (d.Spent->Digest);
        return tx != Transactions.end () && tx->second.Status.mined ();
    }

    bool wallet_cache::consistent () const {
        std::map<Kelvin::terminal, int64> expected;

        for (const Bitcoin::outpoint &op : Unspent) {
            const tx_debit *d = output (op);
            if (d == nullptr || !d->Beneficiary.is_wallet () || spent (*d)) return false;
            const terminal &t = d->Beneficiary.get<own_address> ().Terminal;
            if (address (t) == nullptr) return false;
            // spent in the mempool.
            if (!bool (d->Spent)) expected[t] += int64 (d->Value);
        }

        for (const auto &[k, addrs] : Addresses)
            for (const auto &[i, a] : addrs) {
                auto e = expected.find (a.Terminal);
                if (int64 (a.Balance) != (e == expected.end () ? 0 : e->second)) return false;
            }

        return true;
    }

}
