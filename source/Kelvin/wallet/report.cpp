#include <Kelvin/wallet/report.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    Bitcoin::satoshi balance (const wallet_cache &c) {
        Bitcoin::satoshi total {0};
        for (const auto &[k, addrs] : c.Addresses)
            for (const auto &[i, a] : addrs) total += a.Balance;
        return total;
    }

    list<wallet_addr> address_balance (const wallet_cache &c) {
        list<wallet_addr> x;
        for (const auto &[k, addrs] : c.Addresses)
            for (const auto &[i, a] : addrs) x <<= a;
        return x;
    }

    std::ostream &operator << (std::ostream &o, const coin &c) {
        if (bool (c.Height)) o << *c.Height;
        else o << "mempool";
        return o << "\t" << c.Value << "\t" << write (c.Outpoint) << "\t" << static_cast<const std::string &> (c.Address);
    }

    list<coin> coins (const wallet_cache &c) {
        list<coin> x;
        for (const Bitcoin::outpoint &op : c.Unspent) {
            const tx_debit *d = c.output (op);
            if (d == nullptr || !d->Beneficiary.is_wallet ())
                throw exception {} << "unspent output " << write (op) << " does not belong to the wallet";

            const own_address &owner = d->Beneficiary.get<own_address> ();
            const wallet_tx &tx = c.Transactions.at (op.Digest);
            x <<= coin {tx.Status.mined () ? maybe<uint32> {tx.Status.Mined->Height} : maybe<uint32> {},
                d->Value, op, owner.Terminal, owner.Address};
        }

        return x;
    }

    namespace {
        history_row make_row (const wallet_tx &tx) {
            history_row row {tx.TXID,
                tx.Status.mined () ? maybe<uint32> {tx.Status.Mined->Height} : maybe<uint32> {},
                history_row::credit, Bitcoin::satoshi {0}, tx.Fee, tx.Weight, {}, {}};

            int64 received = 0;
            int64 sent = 0;

            for (const tx_credit &in : tx.Inputs)
                if (in.Payer.is_wallet ()) {
                    sent += int64 (in.Value);
                    row.Own <<= entry<Bitcoin::address, int64> {in.Payer.get<own_address> ().Address, -int64 (in.Value)};
                } else row.Counterparties <<= entry<party, int64> {in.Payer, int64 (in.Value)};

            for (const tx_debit &out : tx.Outputs)
                if (out.Beneficiary.is_wallet ()) {
                    received += int64 (out.Value);
                    row.Own <<= entry<Bitcoin::address, int64> {out.Beneficiary.get<own_address> ().Address, int64 (out.Value)};
                } else row.Counterparties <<= entry<party, int64> {out.Beneficiary, -int64 (out.Value)};

            if (received > sent) {
                row.Operation = history_row::credit;
                row.Amount = Bitcoin::satoshi {received - sent};
            } else {
                row.Operation = history_row::debit;
                row.Amount = Bitcoin::satoshi {sent - received};
            }

            return row;
        }
    }

    list<history_row> history (const wallet_cache &c) {
        std::multimap<uint32, history_row> mined;
        list<history_row> pending;

        for (const auto &[txid, tx] : c.Transactions)
            if (tx.Status.mined ()) mined.emplace (tx.Status.Mined->Height, make_row (tx));
            else pending <<= make_row (tx);

        list<history_row> x;
        for (const auto &[height, row] : mined) x <<= row;
        return x + pending;
    }

    std::ostream &operator << (std::ostream &o, history_row::operation op) {
        return o << (op == history_row::credit ? "+" : "-");
    }

    std::ostream &operator << (std::ostream &o, const history_row &r) {
        if (bool (r.Height)) o << *r.Height;
        else o << "mempool";
        return o << "\t" << write (r.TXID) << "\t" << r.Operation << r.Amount << "\t" << r.fee_rate ();
    }

}
