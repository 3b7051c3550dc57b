#ifndef KELVIN_WALLET_PARTY
#define KELVIN_WALLET_PARTY

#include <Kelvin/wallet/descriptor.hpp>

namespace Kelvin {

    // a script that we have not yet identified.
    struct unknown_script {
        bytes Script;
        bool operator == (const unknown_script &) const = default;
    };

    // the payer of a coinbase input.
    struct subsidy {
        bool operator == (const subsidy &) const = default;
    };

    // an address that belongs to this wallet.
    struct own_address {
        Kelvin::terminal Terminal;
        Bitcoin::address Address;
        bytes Script;
        bool operator == (const own_address &) const = default;
    };

    // an address that belongs to somebody else.
    struct counterparty {
        Bitcoin::address Address;
        bytes Script;
        bool operator == (const counterparty &) const = default;
    };

    // the other side of a credit or debit. A party begins as an unknown
    // script and may be resolved exactly once. Once resolved it never
    // goes back to unknown.
    struct party : either<unknown_script, subsidy, own_address, counterparty> {
        using either<unknown_script, subsidy, own_address, counterparty>::either;

        party () : either<unknown_script, subsidy, own_address, counterparty> {unknown_script {}} {}

        static party unknown (const bytes &script);
        static party coinbase ();
        static party wallet (const derived_address &);
        static party wallet (const Kelvin::terminal &, const Bitcoin::address &, const bytes &script);
        static party external (const Bitcoin::address &, const bytes &script);

        bool is_unknown () const;
        bool is_subsidy () const;
        bool is_wallet () const;
        bool is_counterparty () const;

        // the locking script associated with this party, which does
        // not exist for a coinbase input.
        maybe<bytes> script () const;

        // the address of this party, if known.
        maybe<Bitcoin::address> address () const;

        // replace this party with a resolved one. An unknown party may
        // not replace a resolved one and subsidy is never replaced.
        party &resolve (const party &);

        bool operator == (const party &p) const {
            return static_cast<const either<unknown_script, subsidy, own_address, counterparty> &> (*this) ==
                static_cast<const either<unknown_script, subsidy, own_address, counterparty> &> (p);
        }
    };

    std::ostream &operator << (std::ostream &, const party &);

    party inline party::unknown (const bytes &script) {
        return party {unknown_script {script}};
    }

    party inline party::coinbase () {
        return party {subsidy {}};
    }

    party inline party::wallet (const derived_address &d) {
        return party {own_address {d.Terminal, d.Address, d.Script}};
    }

    party inline party::wallet (const Kelvin::terminal &t, const Bitcoin::address &a, const bytes &script) {
        return party {own_address {t, a, script}};
    }

    party inline party::external (const Bitcoin::address &a, const bytes &script) {
        return party {counterparty {a, script}};
    }

    bool inline party::is_unknown () const {
        return this->is<unknown_script> ();
    }

    bool inline party::is_subsidy () const {
        return this->is<subsidy> ();
    }

    bool inline party::is_wallet () const {
        return this->is<own_address> ();
    }

    bool inline party::is_counterparty () const {
        return this->is<counterparty> ();
    }

}

#endif
