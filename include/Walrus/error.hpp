#ifndef WALRUS_ERROR
#define WALRUS_ERROR

#include <data/io/exception.hpp>
#include <Walrus/types.hpp>

namespace Walrus {

    // codes carried by a data::exception thrown anywhere in this library.
    // The code is also the exit status of the command-line program.
    enum class problem : int {
        none = 0,
        unknown = 1,
        insufficient_funds = 2,
        // invalid user input is always detected before we talk to
        // either the ledger or the signer.
        invalid_input = 3,
        // a call to the ledger service failed. The message is
        // whatever the service returned.
        remote_error = 4,
        signer_unavailable = 5,
        // the user declined on the device or at a prompt.
        user_cancelled = 6
    };

    data::exception inline exception (problem p) {
        return data::exception {static_cast<int> (p)};
    }

    bool inline is (const data::exception &x, problem p) {
        return x.Code == static_cast<int> (p);
    }

    // returned by run in the command-line program.
    struct error {
        int Code;
        maybe<std::string> Message;
        error () : Code {0}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const string &err): Code {code}, Message {err} {}
        error (const string &err): Code {1}, Message {err} {}
    };

    std::ostream inline &operator << (std::ostream &o, problem p) {
        switch (p) {
            case (problem::none) : return o << "none";
            case (problem::insufficient_funds) : return o << "insufficient funds";
            case (problem::invalid_input) : return o << "invalid input";
            case (problem::remote_error) : return o << "remote error";
            case (problem::signer_unavailable) : return o << "signer unavailable";
            case (problem::user_cancelled) : return o << "cancelled by user";
            default: return o << "unknown";
        }
    }
}

#endif
