#include <Kelvin/network/memo.hpp>

namespace Kelvin {

    template <typename F> auto tx_memo::locked (F f) -> decltype (f ()) {
        std::lock_guard<std::mutex> lock (Mutex);
        if (Poisoned) throw memo_poisoned {};
        try {
            return f ();
        } catch (...) {
            Poisoned = true;
            throw;
        }
    }

    maybe<list<indexed_tx>> tx_memo::get (const derived_address &d) {
        return locked ([&] () -> maybe<list<indexed_tx>> {
            auto x = Histories.find (d.Address);
            if (x == Histories.end ()) return {};
            return x->second;
        });
    }

    void tx_memo::put (const derived_address &d, list<indexed_tx> txs) {
        locked ([&] () {
            Histories[d.Address] = txs;
        });
    }

    address_stats tx_memo::stats (const derived_address &d) {
        maybe<list<indexed_tx>> txs = get (d);
        if (!bool (txs)) return address_stats {};
        return address_stats {static_cast<const std::string &> (d.Address), *txs};
    }

    void tx_memo::clear () {
        locked ([&] () {
            Histories.clear ();
        });
    }

    size_t tx_memo::size () {
        return locked ([&] () -> size_t {
            return Histories.size ();
        });
    }

    void tx_memo::access (std::function<void (histories &)> f) {
        locked ([&] () {
            f (Histories);
        });
    }

    bool tx_memo::poisoned () {
        std::lock_guard<std::mutex> lock (Mutex);
        return Poisoned;
    }

}
