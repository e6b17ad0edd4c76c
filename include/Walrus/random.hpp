#ifndef WALRUS_RANDOM
#define WALRUS_RANDOM

#include <data/crypto/NIST_DRBG.hpp>
#include <Walrus/types.hpp>

namespace Walrus {

    // a NIST DRBG seeded by the user typing random characters. It lives
    // only as long as the command that needs it.
    struct secure_random {
        data::user_entropy Entropy;
        data::crypto::NIST::DRBG Random;

        secure_random (std::ostream &, std::istream &);

        operator data::crypto::entropy & () {
            return Random;
        }
    };
}

#endif
