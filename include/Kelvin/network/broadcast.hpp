#ifndef KELVIN_NETWORK_BROADCAST
#define KELVIN_NETWORK_BROADCAST

#include <Kelvin/types.hpp>

namespace Kelvin {

    struct broadcast_result {
        enum result {
            SUCCESS,
            ERROR_UNKNOWN,
            ERROR_NETWORK_CONNECTION_FAIL,
            ERROR_INVALID
        };

        result Error;
        // the body of the response if it was an error, or why we could not connect.
        std::string Details;

        broadcast_result (result e, const std::string &deets = ""): Error {e}, Details {deets} {}
        broadcast_result (): Error {SUCCESS}, Details {} {}

        // broadcast_result is equivalent to true when the
        // operation succeeds.
        operator bool () const {
            return Error == SUCCESS;
        }

        bool error () const {
            return Error != SUCCESS;
        }

        bool success () const {
            return Error == SUCCESS;
        }
    };

    std::ostream &operator << (std::ostream &, const broadcast_result &);

}

#endif
