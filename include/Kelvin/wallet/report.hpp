#ifndef KELVIN_WALLET_REPORT
#define KELVIN_WALLET_REPORT

#include <Kelvin/wallet/cache.hpp>

namespace Kelvin {

    // total balance of all addresses.
    Bitcoin::satoshi balance (const wallet_cache &);

    // every address that the wallet has used, ordered by terminal.
    list<wallet_addr> address_balance (const wallet_cache &);

    struct coin {
        // empty if the coin is in the mempool.
        maybe<uint32> Height;
        Bitcoin::satoshi Value;
        Bitcoin::outpoint Outpoint;
        Kelvin::terminal Terminal;
        Bitcoin::address Address;

        bool operator == (const coin &) const = default;
    };

    std::ostream &operator << (std::ostream &, const coin &);

    // one coin for every unspent output, ordered by outpoint.
    list<coin> coins (const wallet_cache &);

    struct history_row {
        enum operation {
            credit,
            debit
        };

        Bitcoin::TXID TXID;
        maybe<uint32> Height;
        operation Operation;
        // always positive.
        Bitcoin::satoshi Amount;
        Bitcoin::satoshi Fee;
        uint32 Weight;
        // outputs to the wallet are positive and inputs from it are negative.
        list<entry<Bitcoin::address, int64>> Own;
        // inputs from others are positive and outputs to others are negative.
        list<entry<party, int64>> Counterparties;

        // satoshis per virtual byte.
        double fee_rate () const;
    };

    std::ostream &operator << (std::ostream &, history_row::operation);
    std::ostream &operator << (std::ostream &, const history_row &);

    // one row per transaction, mempool transactions last.
    list<history_row> history (const wallet_cache &);

    double inline history_row::fee_rate () const {
        return Weight == 0 ? 0 : double (int64 (Fee)) * 4.0 / double (Weight);
    }

}

#endif
