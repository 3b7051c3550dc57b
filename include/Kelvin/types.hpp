#ifndef KELVIN_TYPES
#define KELVIN_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <Gigamonkey.hpp>
#include <gigamonkey/script/pattern/pay_to_address.hpp>

#include <compare>
#include <map>
#include <set>

namespace Kelvin {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    namespace HD = Gigamonkey::HD;
    using digest256 = Gigamonkey::digest256;
    using digest160 = Gigamonkey::digest160;
    using pay_to_address = Gigamonkey::pay_to_address;

    // a numbered derivation branch of a wallet. By convention 0 is
    // for receiving and 1 is for change.
    using keychain = uint32;

    // identifies a single derived address.
    struct terminal {
        keychain Keychain {0};
        uint32 Index {0};

        terminal () {}
        terminal (keychain k, uint32 i) : Keychain {k}, Index {i} {}

        bool operator == (const terminal &) const = default;
        std::strong_ordering operator <=> (const terminal &) const = default;
    };

    std::ostream inline &operator << (std::ostream &o, const terminal &t) {
        return o << "&" << t.Keychain << "/" << t.Index;
    }

    // an inpoint is similar to an outpoint except that it points
    // to an input rather than to an output.
    struct inpoint : Bitcoin::outpoint {
        using Bitcoin::outpoint::outpoint;
        inpoint () : Bitcoin::outpoint {} {}
        explicit inpoint (const Bitcoin::outpoint &o) : outpoint {o} {}
    };

    // the address type used for a given network.
    Bitcoin::address::type inline address_type (Bitcoin::net n) {
        return n == Bitcoin::net::Test ? Bitcoin::address::test : Bitcoin::address::main;
    }
}

#endif
