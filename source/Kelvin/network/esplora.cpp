#include <Kelvin/network/esplora.hpp>
#include <Kelvin/write.hpp>

namespace Kelvin {

    std::string esplora::script_hash (const bytes &script) {
        return write (Bitcoin::TXID {Gigamonkey::SHA2_256 (script)});
    }

    list<indexed_tx> esplora::get_txs (const std::string &path, const maybe<Bitcoin::TXID> &last_seen) {

        std::stringstream ss;
        ss << Prefix << path << "/txs";
        if (bool (last_seen)) ss << "/chain/" << write (*last_seen);

        auto request = this->REST.GET (ss.str ());
        auto response = (*this) (request);

        if (response.Status != net::HTTP::status::ok)
            throw net::HTTP::exception {request, response, string {"response status is not ok. body is: "} + response.Body};

        list<indexed_tx> txs;

        try {

            JSON info = JSON::parse (response.Body);

            if (!info.is_array ()) throw net::HTTP::exception {request, response, "expect array"};

            for (const JSON &item : info) txs <<= indexed_tx {item};

        } catch (const JSON::exception &exception) {
            throw net::HTTP::exception {request, response, string {"problem reading JSON: "} + string {exception.what ()}};
        }

        return txs;
    }

    list<indexed_tx> esplora::transactions (const derived_address &d, const maybe<Bitcoin::TXID> &last_seen) {
        return get_txs (string {"/scripthash/"} + script_hash (d.Script), last_seen);
    }

    address_stats esplora::stats (const Bitcoin::address &addr) {

        auto request = this->REST.GET (Prefix + "/address/" + static_cast<const std::string &> (addr));
        auto response = (*this) (request);

        if (response.Status != net::HTTP::status::ok) {
            std::stringstream z;
            z << "status = \"" << response.Status << "\"; ";
            z << "body = \"" << response.Body << "\"";
            throw net::HTTP::exception {request, response, z.str ()};
        }

        try {
            return address_stats {JSON::parse (response.Body)};
        } catch (const JSON::exception &exception) {
            throw net::HTTP::exception {request, response, string {"problem reading JSON: "} + string {exception.what ()}};
        }
    }

    broadcast_result esplora::broadcast (const bytes &tx) {

        net::HTTP::request req = net::HTTP::request (this->REST (net::HTTP::request::make {}.method (net::HTTP::method::post).
            path (Prefix + "/tx").body (encoding::hex::write (tx))));

        try {
            auto response = (*this) (req);

            if (response.Status == net::HTTP::status::ok) return broadcast_result::SUCCESS;
            if (response.Status == 400) return {broadcast_result::ERROR_INVALID, response.Body};
            return {broadcast_result::ERROR_UNKNOWN, response.Body};
        } catch (const net::HTTP::exception &ex) {
            return {broadcast_result::ERROR_NETWORK_CONNECTION_FAIL, ex.what ()};
        }
    }

}
