#ifndef KELVIN_WALLET_DESCRIPTOR
#define KELVIN_WALLET_DESCRIPTOR

#include <Kelvin/types.hpp>
#include <gigamonkey/schema/hd.hpp>

namespace Kelvin {

    // an address derived from a wallet descriptor together with
    // the output script that pays to it.
    struct derived_address {
        Kelvin::terminal Terminal;
        Bitcoin::address Address;
        bytes Script;

        derived_address () : Terminal {}, Address {}, Script {} {}
        derived_address (const Kelvin::terminal &t, const Bitcoin::address &a, const bytes &script) :
            Terminal {t}, Address {a}, Script {script} {}

        bool operator == (const derived_address &) const = default;
    };

    std::ostream inline &operator << (std::ostream &o, const derived_address &d) {
        return o << d.Terminal << " " << static_cast<const std::string &> (d.Address);
    }

    struct descriptor;

    // an unbounded sequence of addresses for a single keychain.
    struct address_sequence {
        const descriptor *Descriptor;
        keychain Keychain;
        // index of the next address to be produced.
        uint32 Last;

        address_sequence (const descriptor &d, keychain k, uint32 l = 0) :
            Descriptor {&d}, Keychain {k}, Last {l} {}

        derived_address last () const;
        address_sequence next () const;
    };

    // the description of a wallet from which all addresses can be derived.
    struct descriptor {
        virtual std::set<keychain> keychains () const = 0;
        virtual derived_address derive (keychain, uint32 index) const = 0;
        virtual Bitcoin::net network () const = 0;

        address_sequence addresses (keychain k) const {
            return address_sequence {*this, k};
        }

        virtual ~descriptor () {}
    };

    derived_address inline address_sequence::last () const {
        return Descriptor->derive (Keychain, Last);
    }

    address_sequence inline address_sequence::next () const {
        return address_sequence {*Descriptor, Keychain, Last + 1};
    }

    // pay to address outputs derived from an extended public key. Each keychain
    // is a non-hardened path from the key. For a BIP 44 account key the
    // keychains are {0: {0}, 1: {1}}.
    struct HD_descriptor final : descriptor {
        HD::BIP_32::pubkey Key;
        std::map<keychain, HD::BIP_32::path> Keychains;

        HD_descriptor (const HD::BIP_32::pubkey &k, std::map<keychain, HD::BIP_32::path> x) :
            Key {k}, Keychains {x} {}

        // receive and change keychains of a BIP 44 account.
        static HD_descriptor BIP_44_account (const HD::BIP_32::pubkey &);

        std::set<keychain> keychains () const final override;
        derived_address derive (keychain, uint32 index) const final override;
        Bitcoin::net network () const final override;

        bool valid () const;
    };

}

#endif
