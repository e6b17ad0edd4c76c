#ifndef WALRUS_WALLET_SEED
#define WALRUS_WALLET_SEED

#include <data/crypto/random.hpp>
#include <Walrus/address.hpp>

namespace Walrus {

    // a BIP 39 seed phrase. The key with index i is derived
    // from the master key along the path m/i.
    struct seed {
        HD::BIP_32::secret Master;

        // throws signer_unavailable if the words are not a valid phrase.
        static seed read (const std::string &words);

        // generate a new 24 word phrase.
        static std::string generate (crypto::entropy &);

        // throws invalid_input if the index is too big.
        secp256k1::secret secret_key (uint64 index) const;
        secp256k1::pubkey public_key (uint64 index) const;

        unlock_hash address (uint64 index) const {
            return unlock_conditions::standard (public_key (index)).address ();
        }
    };
}

#endif
