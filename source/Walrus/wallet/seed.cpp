#include <Walrus/wallet/seed.hpp>
#include <Walrus/options.hpp>
#include <gigamonkey/schema/bip_39.hpp>

namespace Walrus {

    seed seed::read (const std::string &words) {
        if (!HD::BIP_39::valid (words)) throw exception (problem::signer_unavailable) << "invalid seed phrase";
        return seed {HD::BIP_32::secret::from_seed (HD::BIP_39::read (words))};
    }

    std::string seed::generate (crypto::entropy &random) {
        // 32 bytes of entropy for 24 words.
        bytes seed_entropy {};
        seed_entropy.resize (32);
        random >> seed_entropy;
        return HD::BIP_39::generate (seed_entropy);
    }

    secp256k1::secret seed::secret_key (uint64 index) const {
        if (index > options::MaxKeyIndex) throw exception (problem::invalid_input) << "key index " << index << " is too big";
        return Master.derive (HD::BIP_32::path {static_cast<uint32> (index)}).Secret;
    }

    secp256k1::pubkey seed::public_key (uint64 index) const {
        return secret_key (index).to_public ();
    }

}
