#ifndef KELVIN_NETWORK_MEMO
#define KELVIN_NETWORK_MEMO

#include <Kelvin/network/indexed.hpp>
#include <Kelvin/wallet/descriptor.hpp>
#include <Kelvin/error.hpp>

#include <mutex>
#include <functional>

namespace Kelvin {

    // the most recently downloaded history of each address. This is only
    // here to save network calls and can be cleared at any time.
    //
    // If an exception is thrown while the memo is locked, the memo is
    // poisoned and every subsequent call throws memo_poisoned.
    struct tx_memo {
        using histories = std::map<Bitcoin::address, list<indexed_tx>>;

        maybe<list<indexed_tx>> get (const derived_address &);

        // replaces whatever was there before.
        void put (const derived_address &, list<indexed_tx>);

        // stats of the history that we have. Empty if we have no history.
        address_stats stats (const derived_address &);

        void clear ();

        size_t size ();

        // run a function on the histories while the memo is locked. This is
        // a hook for tests. The indexer only uses the methods above.
        void access (std::function<void (histories &)>);

        bool poisoned ();

    private:
        std::mutex Mutex;
        bool Poisoned {false};
        histories Histories;

        template <typename F> auto locked (F f) -> decltype (f ());
    };

}

#endif
