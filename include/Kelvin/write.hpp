#ifndef KELVIN_WRITE
#define KELVIN_WRITE

#include <Kelvin/types.hpp>

// provide standard ways of converting certain types into strings and back.
namespace Kelvin {

    // txids are written in the usual reversed hex format without a prefix.
    std::string write (const Bitcoin::TXID &);
    Bitcoin::TXID read_TXID (string_view);

    std::string write (const Bitcoin::outpoint &);
    Bitcoin::outpoint read_outpoint (const string &);

    JSON write (const Bitcoin::satoshi &j);
    Bitcoin::satoshi read_satoshi (const JSON &j);

    bytes read_hex (const JSON &j);

    std::string inline write (const Bitcoin::TXID &txid) {
        std::string x = encoding::hexidecimal::write (txid);
        return x.substr (0, 2) == "0x" ? x.substr (2) : x;
    }

    std::string inline write (const Bitcoin::outpoint &o) {
        std::stringstream ss;
        ss << write (o.Digest) << ":" << o.Index;
        return ss.str ();
    }

    Bitcoin::TXID inline read_TXID (string_view x) {
        // the zero txid is valid because coinbase inputs refer to it.
        if (x.size () != 64 || !bool (encoding::hex::read (std::string {x}))) throw exception {} << "invalid txid " << x;
        return Bitcoin::TXID {std::string {"0x"} + std::string {x}};
    }

    JSON inline write (const Bitcoin::satoshi &j) {
        return JSON (int64 (j));
    }

    Bitcoin::satoshi inline read_satoshi (const JSON &j) {
        return Bitcoin::satoshi (int64 (j));
    }
}

#endif
