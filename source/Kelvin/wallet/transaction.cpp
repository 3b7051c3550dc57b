#include <Kelvin/wallet/transaction.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    tx_status::tx_status (const indexed_tx::status &s) : Mined {} {
        if (!s.Confirmed || !bool (s.BlockHeight) || !bool (s.BlockHash) || !bool (s.BlockTime)) return;
        // a height of zero is not allowed, so the genesis block is reported as 1.
        Mined = mining_info {*s.BlockHeight == 0 ? 1 : *s.BlockHeight, Bitcoin::timestamp {*s.BlockTime}, *s.BlockHash};
    }

    std::ostream &operator << (std::ostream &o, const tx_status &s) {
        if (!s.mined ()) return o << "mempool";
        return o << "mined at " << s.Mined->Height;
    }

    wallet_tx::wallet_tx (const indexed_tx &tx) : wallet_tx {} {
        TXID = tx.TXID;
        Status = tx_status {tx.Status};
        Fee = tx.Fee;
        Size = tx.Size;
        Weight = tx.Weight;
        Version = tx.Version;
        Locktime = tx.Locktime;

        for (const indexed_tx::input &in : tx.Inputs) Inputs.push_back (tx_credit {
            in.Outpoint, in.Sequence, in.Coinbase, in.ScriptSig, in.Witness,
            bool (in.Prevout) ? in.Prevout->Value : Bitcoin::satoshi {0},
            bool (in.Prevout) ? party::unknown (in.Prevout->Script) : party::coinbase ()});

        uint32 index = 0;
        for (const indexed_tx::output &out : tx.Outputs) Outputs.push_back (tx_debit {
            Bitcoin::outpoint {tx.TXID, index++}, party::unknown (out.Script), out.Value, {}});
    }

    wallet_tx &wallet_tx::merge (const wallet_tx &fresh) {
        if (fresh.TXID != TXID) throw exception {} << "cannot merge tx " << write (fresh.TXID) << " into " << write (TXID);

        Status = fresh.Status;
        Fee = fresh.Fee;
        Size = fresh.Size;
        Weight = fresh.Weight;

        if (Inputs.size () != fresh.Inputs.size () || Outputs.size () != fresh.Outputs.size ())
            throw exception {} << "inconsistent versions of tx " << write (TXID);

        for (size_t i = 0; i < Inputs.size (); i++) Inputs[i].Payer.resolve (fresh.Inputs[i].Payer);

        for (size_t i = 0; i < Outputs.size (); i++) {
            Outputs[i].Beneficiary.resolve (fresh.Outputs[i].Beneficiary);
            if (!bool (Outputs[i].Spent)) Outputs[i].Spent = fresh.Outputs[i].Spent;
        }

        return *this;
    }

}
