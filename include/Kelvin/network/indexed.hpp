#ifndef KELVIN_NETWORK_INDEXED
#define KELVIN_NETWORK_INDEXED

#include <Kelvin/types.hpp>

namespace Kelvin {

    // a transaction as it is returned by an Esplora-style indexer.
    struct indexed_tx {

        struct prevout {
            bytes Script;
            Bitcoin::satoshi Value;

            bool operator == (const prevout &) const = default;
        };

        struct input {
            Bitcoin::outpoint Outpoint;
            // missing for coinbase inputs.
            maybe<prevout> Prevout;
            bytes ScriptSig;
            list<bytes> Witness;
            bool Coinbase;
            uint32 Sequence;

            bool operator == (const input &) const = default;
        };

        struct output {
            bytes Script;
            Bitcoin::satoshi Value;

            bool operator == (const output &) const = default;
        };

        struct status {
            bool Confirmed;
            maybe<uint32> BlockHeight;
            maybe<digest256> BlockHash;
            maybe<uint32> BlockTime;

            status () : Confirmed {false}, BlockHeight {}, BlockHash {}, BlockTime {} {}
            status (uint32 height, const digest256 &hash, uint32 time) :
                Confirmed {true}, BlockHeight {height}, BlockHash {hash}, BlockTime {time} {}

            explicit status (const JSON &);

            bool operator == (const status &) const = default;
        };

        Bitcoin::TXID TXID;
        int32 Version;
        uint32 Locktime;
        list<input> Inputs;
        list<output> Outputs;
        uint32 Size;
        uint32 Weight;
        Bitcoin::satoshi Fee;
        status Status;

        indexed_tx () : TXID {}, Version {1}, Locktime {0}, Inputs {}, Outputs {}, Size {0}, Weight {0}, Fee {0}, Status {} {}

        // read from the Esplora REST schema. Throws if a required field is missing.
        explicit indexed_tx (const JSON &);

        bool operator == (const indexed_tx &) const = default;
    };

    // the lightweight summary of the history of an address.
    struct address_stats {
        // empty if the indexer did not report anything for the address.
        std::string Address;
        uint64 Confirmed;
        uint64 Unconfirmed;

        address_stats () : Address {}, Confirmed {0}, Unconfirmed {0} {}
        address_stats (const std::string &a, uint64 c, uint64 u) : Address {a}, Confirmed {c}, Unconfirmed {u} {}

        // count the confirmed and unconfirmed transactions in a history.
        address_stats (const std::string &a, list<indexed_tx>);

        explicit address_stats (const JSON &);

        bool empty () const {
            return Address == "";
        }

        bool operator == (const address_stats &) const = default;
    };

    std::ostream &operator << (std::ostream &, const address_stats &);

}

#endif
