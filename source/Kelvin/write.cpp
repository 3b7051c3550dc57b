#include <Kelvin/write.hpp>

namespace Kelvin {

    Bitcoin::outpoint read_outpoint (const string &x) {
        list<string_view> z = data::split (x, ":");
        if (z.size () != 2) throw exception {} << "invalid outpoint format: " << x;
        Bitcoin::outpoint o;
        o.Digest = read_TXID (z[0]);
        o.Index = strtoul (std::string {z[1]}.c_str (), nullptr, 10);
        return o;
    }

    bytes read_hex (const JSON &j) {
        if (!j.is_string ()) throw exception {} << "expected hex string but found " << j;
        maybe<bytes> b = encoding::hex::read (std::string (j));
        if (!bool (b)) throw exception {} << "could not read hex value from " << j;
        return *b;
    }

}
