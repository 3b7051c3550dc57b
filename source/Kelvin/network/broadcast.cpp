#include <Kelvin/network/broadcast.hpp>

namespace Kelvin {

    std::ostream &operator << (std::ostream &o, const broadcast_result &r) {
        switch (r.Error) {
            case (broadcast_result::SUCCESS) : return o << "success";
            case (broadcast_result::ERROR_NETWORK_CONNECTION_FAIL) : return o << "could not connect to the network: " << r.Details;
            case (broadcast_result::ERROR_INVALID) : return o << "invalid transaction: " << r.Details;
            default : return o << "unknown error: " << r.Details;
        }
    }

}
