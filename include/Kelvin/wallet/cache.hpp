#ifndef KELVIN_WALLET_CACHE
#define KELVIN_WALLET_CACHE

#include <Kelvin/wallet/transaction.hpp>

namespace Kelvin {

    // what we know about an address that has been used by the wallet.
    struct wallet_addr {
        Kelvin::terminal Terminal;
        Bitcoin::address Address;
        bytes Script;
        // number of outputs that pay to this address.
        uint32 Used;
        // total amount ever received.
        Bitcoin::satoshi Volume;
        Bitcoin::satoshi Balance;

        wallet_addr () : Terminal {}, Address {}, Script {}, Used {0}, Volume {0}, Balance {0} {}
        explicit wallet_addr (const derived_address &d) :
            Terminal {d.Terminal}, Address {d.Address}, Script {d.Script}, Used {0}, Volume {0}, Balance {0} {}

        party owner () const {
            return party::wallet (Terminal, Address, Script);
        }

        bool operator == (const wallet_addr &) const = default;
    };

    std::ostream &operator << (std::ostream &, const wallet_addr &);

    // the local state of a wallet.
    struct wallet_cache {
        std::map<keychain, std::map<uint32, wallet_addr>> Addresses;
        std::map<Bitcoin::TXID, wallet_tx> Transactions;
        std::set<Bitcoin::outpoint> Unspent;

        const wallet_addr *address (const Kelvin::terminal &) const;
        const tx_debit *output (const Bitcoin::outpoint &) const;

        // true if the output has been redeemed by a transaction that is mined.
        bool spent (const tx_debit &) const;

        // check that every unspent output belongs to the wallet and that every
        // address balance equals the sum of the unspent outputs that pay to it,
        // less outputs that are spent in the mempool.
        bool consistent () const;

        bool operator == (const wallet_cache &) const = default;
    };

}

#endif
