#include <Kelvin/wallet/party.hpp>

namespace Kelvin {

    maybe<bytes> party::script () const {
        if (is_unknown ()) return this->get<unknown_script> ().Script;
        if (is_wallet ()) return this->get<own_address> ().Script;
        if (is_counterparty ()) return this->get<counterparty> ().Script;
        return {};
    }

    maybe<Bitcoin::address> party::address () const {
        if (is_wallet ()) return this->get<own_address> ().Address;
        if (is_counterparty ()) return this->get<counterparty> ().Address;
        return {};
    }

    party &party::resolve (const party &p) {
        if (is_subsidy () || p.is_unknown ()) return *this;
        return *this = p;
    }

    std::ostream &operator << (std::ostream &o, const party &p) {
        if (p.is_subsidy ()) return o << "coinbase";
        if (p.is_wallet ()) {
            const auto &w = p.get<own_address> ();
            return o << static_cast<const std::string &> (w.Address) << " " << w.Terminal;
        }

        if (p.is_counterparty ()) return o << static_cast<const std::string &> (p.get<counterparty> ().Address);
        return o << "unknown script " << encoding::hex::write (p.get<unknown_script> ().Script);
    }

}
