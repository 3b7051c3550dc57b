#include <Kelvin/network/indexed.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    indexed_tx::status::status (const JSON &j) : status {} {
        Confirmed = bool (j.at ("confirmed"));
        if (j.contains ("block_height") && !j["block_height"].is_null ())
            BlockHeight = uint32 (j["block_height"]);
        if (j.contains ("block_hash") && !j["block_hash"].is_null ())
            BlockHash = read_TXID (std::string (j["block_hash"]));
        if (j.contains ("block_time") && !j["block_time"].is_null ())
            BlockTime = uint32 (j["block_time"]);
    }

    indexed_tx::indexed_tx (const JSON &j) : indexed_tx {} {
        TXID = read_TXID (std::string (j.at ("txid")));
        Version = int32 (j.at ("version"));
        Locktime = uint32 (j.at ("locktime"));
        Size = uint32 (j.at ("size"));
        Weight = uint32 (j.at ("weight"));
        Fee = read_satoshi (j.at ("fee"));
        Status = status {j.at ("status")};

        for (const JSON &vin : j.at ("vin")) {
            input in;
            in.Outpoint = Bitcoin::outpoint {read_TXID (std::string (vin.at ("txid"))), uint32 (vin.at ("vout"))};
            in.Coinbase = vin.contains ("is_coinbase") && bool (vin["is_coinbase"]);
            in.Sequence = uint32 (vin.at ("sequence"));

            if (vin.contains ("scriptsig")) in.ScriptSig = read_hex (vin["scriptsig"]);

            if (vin.contains ("witness") && vin["witness"].is_array ())
                for (const JSON &w : vin["witness"]) in.Witness <<= read_hex (w);

            if (vin.contains ("prevout") && !vin["prevout"].is_null ()) {
                const JSON &p = vin["prevout"];
                in.Prevout = prevout {read_hex (p.at ("scriptpubkey")), read_satoshi (p.at ("value"))};
            }

            Inputs <<= in;
        }

        for (const JSON &vout : j.at ("vout"))
            Outputs <<= output {read_hex (vout.at ("scriptpubkey")), read_satoshi (vout.at ("value"))};
    }

    address_stats::address_stats (const std::string &a, list<indexed_tx> txs) : address_stats {a, 0, 0} {
        for (const indexed_tx &tx : txs)
            if (tx.Status.Confirmed) Confirmed++;
            else Unconfirmed++;
    }

    address_stats::address_stats (const JSON &j) : address_stats {} {
        if (!j.is_object ()) throw exception {} << "address stats should be an object";
        if (!j.contains ("address")) return;
        Address = std::string (j["address"]);
        Confirmed = uint64 (j.at ("chain_stats").at ("tx_count"));
        Unconfirmed = uint64 (j.at ("mempool_stats").at ("tx_count"));
    }

    std::ostream &operator << (std::ostream &o, const address_stats &s) {
        return o << "stats {" << s.Address << ", confirmed: " << s.Confirmed << ", unconfirmed: " << s.Unconfirmed << "}";
    }

}
