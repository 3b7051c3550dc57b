#ifndef KELVIN_ERROR
#define KELVIN_ERROR

#include <Kelvin/types.hpp>

namespace Kelvin {

    // a non-fatal problem encountered during a sync session.
    struct error {
        enum code {
            none = 0,
            unknown = 1,
            // a transaction history could not be retrieved.
            fetch = 2,
            // an address summary could not be retrieved.
            stats = 3,
            // a response could not be read.
            invalid_response = 4
        };

        int Code;
        maybe<std::string> Message;

        error () : Code {none}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const std::string &err): Code {code}, Message {err} {}
        error (const std::string &err): Code {unknown}, Message {err} {}

        bool operator == (const error &) const = default;
    };

    std::ostream inline &operator << (std::ostream &o, const error &e) {
        o << "error " << e.Code;
        if (bool (e.Message)) o << ": " << *e.Message;
        return o;
    }

    // a result which is always usable but which may have been
    // produced in spite of some errors along the way.
    template <typename X> struct may_error {
        X Value;
        list<error> Errors;

        may_error (const X &x) : Value {x}, Errors {} {}
        may_error (const X &x, list<error> errs) : Value {x}, Errors {errs} {}

        // true if there were no errors.
        bool valid () const {
            return data::empty (Errors);
        }

        explicit operator bool () const {
            return valid ();
        }

        const X &operator * () const {
            return Value;
        }

        X &operator * () {
            return Value;
        }

        const X *operator -> () const {
            return &Value;
        }

        X *operator -> () {
            return &Value;
        }
    };

    // thrown when the address memo has been left in an inconsistent
    // state by an earlier failure. This aborts the session.
    struct memo_poisoned : std::logic_error {
        memo_poisoned () : std::logic_error {"address transaction memo is poisoned"} {}
    };

}

#endif
