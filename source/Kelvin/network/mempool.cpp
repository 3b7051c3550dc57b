#include <Kelvin/network/mempool.hpp>

namespace Kelvin {

    list<indexed_tx> mempool::transactions (const derived_address &d, const maybe<Bitcoin::TXID> &last_seen) {
        return get_txs (string {"/address/"} + static_cast<const std::string &> (d.Address), last_seen);
    }

}
