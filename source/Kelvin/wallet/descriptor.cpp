#include <Kelvin/wallet/descriptor.hpp>
#include <gigamonkey/schema/bip_44.hpp>

namespace Kelvin {

    HD_descriptor HD_descriptor::BIP_44_account (const HD::BIP_32::pubkey &k) {
        return HD_descriptor {k, {
            {0, HD::BIP_32::path {HD::BIP_44::receive_index}},
            {1, HD::BIP_32::path {HD::BIP_44::change_index}}}};
    }

    std::set<keychain> HD_descriptor::keychains () const {
        std::set<keychain> x;
        for (const auto &[k, _] : Keychains) x.insert (k);
        return x;
    }

    derived_address HD_descriptor::derive (keychain k, uint32 index) const {
        auto p = Keychains.find (k);
        if (p == Keychains.end ()) throw exception {} << "keychain " << k << " is not part of this descriptor";
        if (HD::BIP_32::hardened (index)) throw exception {} << "cannot derive hardened index " << index << " from a pubkey";

        Bitcoin::address::decoded next_address = Key.derive (p->second << index).address ();
        return derived_address {terminal {k, index}, next_address.encode (), pay_to_address::script (next_address.Digest)};
    }

    Bitcoin::net HD_descriptor::network () const {
        return Key.Net == HD::BIP_32::test ? Bitcoin::net::Test : Bitcoin::net::Main;
    }

    bool HD_descriptor::valid () const {
        if (!Key.valid () || Keychains.size () == 0) return false;
        for (const auto &[_, path] : Keychains)
            for (uint32 u : path) if (HD::BIP_32::hardened (u)) return false;
        return true;
    }

}
