#ifndef KELVIN_WALLET_TRANSACTION
#define KELVIN_WALLET_TRANSACTION

#include <Kelvin/wallet/party.hpp>
#include <Kelvin/network/indexed.hpp>

namespace Kelvin {

    struct mining_info {
        // never zero.
        uint32 Height;
        Bitcoin::timestamp Time;
        digest256 BlockHash;

        bool operator == (const mining_info &) const = default;
    };

    // a transaction is either in the mempool or mined.
    struct tx_status {
        maybe<mining_info> Mined;

        tx_status () : Mined {} {}
        tx_status (const mining_info &m) : Mined {m} {}

        // an indexer status that does not have all the mining
        // info is treated as unconfirmed.
        explicit tx_status (const indexed_tx::status &);

        bool mined () const {
            return bool (Mined);
        }

        bool operator == (const tx_status &) const = default;
    };

    std::ostream &operator << (std::ostream &, const tx_status &);

    // an input, which is a credit from the point of view of a transaction.
    struct tx_credit {
        Bitcoin::outpoint Outpoint;
        uint32 Sequence;
        bool Coinbase;
        bytes ScriptSig;
        list<bytes> Witness;
        Bitcoin::satoshi Value;
        party Payer;

        bool operator == (const tx_credit &) const = default;
    };

    // an output.
    struct tx_debit {
        Bitcoin::outpoint Outpoint;
        party Beneficiary;
        Bitcoin::satoshi Value;
        // the input that redeems this output, if we know about it.
        maybe<inpoint> Spent;

        bool operator == (const tx_debit &) const = default;
    };

    struct wallet_tx {
        Bitcoin::TXID TXID;
        tx_status Status;
        cross<tx_credit> Inputs;
        cross<tx_debit> Outputs;
        Bitcoin::satoshi Fee;
        uint32 Size;
        uint32 Weight;
        int32 Version;
        uint32 Locktime;

        wallet_tx () : TXID {}, Status {}, Inputs {}, Outputs {}, Fee {0}, Size {0}, Weight {0}, Version {1}, Locktime {0} {}

        // all parties are initially unknown except for the payers
        // of coinbase inputs, which are subsidy.
        explicit wallet_tx (const indexed_tx &);

        // update with a newer version of the same transaction. Status, fee, size
        // and weight are replaced. Resolved parties and spent links are kept.
        wallet_tx &merge (const wallet_tx &fresh);

        bool operator == (const wallet_tx &) const = default;
    };

}

#endif
