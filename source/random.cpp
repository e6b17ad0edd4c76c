#include <Walrus/random.hpp>

namespace Walrus {

    secure_random::secure_random (std::ostream &out, std::istream &in) :
        Entropy {
            "We need some entropy to generate a seed. Please type random characters.",
            "Thank you for your entropy so far. That was not enough. Please give us more random characters.",
            "Sufficient entropy provided.", out, in},
        Random {data::crypto::NIST::DRBG::Hash, Entropy, std::numeric_limits<uint32>::max ()} {}

}
