#ifndef KELVIN_NETWORK_ESPLORA
#define KELVIN_NETWORK_ESPLORA

#include <Kelvin/network/source.hpp>
#include <data/net/HTTP_client.hpp>

namespace Kelvin {

    // an Esplora REST API, which indexes histories by script hash.
    struct esplora : net::HTTP::client_blocking, tx_source {

        // path of the API on the host, such as "/api".
        std::string Prefix;

        esplora (ptr<net::HTTP::SSL> ssl, const std::string &host, const std::string &prefix = "/api") :
            net::HTTP::client_blocking {ssl, net::HTTP::REST {"https", host}, tools::rate_limiter {3, 1}}, Prefix {prefix} {}
        esplora (const std::string &host, const std::string &prefix = "/api") :
            net::HTTP::client_blocking {net::HTTP::REST {"https", host}, tools::rate_limiter {3, 1}}, Prefix {prefix} {}

        // https://blockstream.info/api
        static esplora blockstream (ptr<net::HTTP::SSL> ssl) {
            return esplora {ssl, "blockstream.info"};
        }

        // the sha256 hash of a script, written in reverse order.
        static std::string script_hash (const bytes &script);

        list<indexed_tx> transactions (const derived_address &, const maybe<Bitcoin::TXID> &last_seen) override;

        address_stats stats (const Bitcoin::address &) final override;

        broadcast_result broadcast (const bytes &tx) final override;

    protected:
        // GET a JSON array of transactions.
        list<indexed_tx> get_txs (const std::string &path, const maybe<Bitcoin::TXID> &last_seen);
    };

}

#endif
