#ifndef WALRUS_ADDRESS
#define WALRUS_ADDRESS

#include <Walrus/types.hpp>
#include <Walrus/error.hpp>
#include <Walrus/encoding.hpp>

namespace Walrus {

    // an address. The string form is the hash in hex followed
    // by a 6 byte checksum in hex, 76 characters in all.
    struct unlock_hash {
        digest256 Hash;

        unlock_hash () : Hash {} {}
        explicit unlock_hash (const digest256 &d) : Hash {d} {}

        constexpr static uint32 Size {76};

        // throws invalid_input if the string is not a well-formed address.
        static unlock_hash read (string_view);

        // true if the string is a well-formed address.
        static bool valid (string_view);

        std::string write () const;

        bool operator == (const unlock_hash &u) const {
            return Hash == u.Hash;
        }

        bool operator != (const unlock_hash &u) const {
            return !(Hash == u.Hash);
        }

        bool operator < (const unlock_hash &u) const {
            return Hash < u.Hash;
        }

        explicit unlock_hash (const JSON &);
        explicit operator JSON () const {
            return JSON (write ());
        }
    };

    std::ostream inline &operator << (std::ostream &o, const unlock_hash &u) {
        return o << u.write ();
    }

    // the conditions under which an output may be spent.
    struct unlock_conditions {
        uint64 Timelock;
        list<secp256k1::pubkey> PublicKeys;
        uint64 SignaturesRequired;

        unlock_conditions () : Timelock {0}, PublicKeys {}, SignaturesRequired {0} {}
        unlock_conditions (uint64 t, list<secp256k1::pubkey> k, uint64 r) :
            Timelock {t}, PublicKeys {k}, SignaturesRequired {r} {}

        // one key, one signature, no timelock.
        static unlock_conditions standard (const secp256k1::pubkey &);

        // the address that these conditions hash to.
        unlock_hash address () const;

        bool operator == (const unlock_conditions &u) const {
            return Timelock == u.Timelock && PublicKeys == u.PublicKeys && SignaturesRequired == u.SignaturesRequired;
        }

        explicit unlock_conditions (const JSON &);
        explicit operator JSON () const;
    };

    encoder &operator << (encoder &, const unlock_conditions &);

    unlock_conditions inline unlock_conditions::standard (const secp256k1::pubkey &p) {
        return unlock_conditions {0, {p}, 1};
    }

    inline unlock_hash::unlock_hash (const JSON &j) : unlock_hash {} {
        if (!j.is_string ()) throw exception (problem::invalid_input) << "expected address as a string";
        *this = read (std::string (j));
    }
}

#endif
