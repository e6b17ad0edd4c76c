#ifndef WALRUS_WALLET_SIGNER
#define WALRUS_WALLET_SIGNER

#include <Walrus/wallet/seed.hpp>
#include <Walrus/transaction.hpp>
#include <iostream>

namespace Walrus {

    // ask the user a yes or no question.
    using confirmation = data::function<bool (const std::string &)>;

    // a signature that we are responsible for.
    struct signature_slot {
        uint32 InputIndex;
        // position of the signature entry in the transaction.
        uint32 SignatureIndex;
        uint64 KeyIndex;

        bool operator == (const signature_slot &s) const {
            return InputIndex == s.InputIndex && SignatureIndex == s.SignatureIndex && KeyIndex == s.KeyIndex;
        }
    };

    // holds the keys. A signer is acquired once for a command and released when it is done.
    struct signer {
        virtual secp256k1::pubkey public_key (uint64 key_index) = 0;

        // called once before any signatures are requested. The transaction
        // already has an unsigned entry for every slot.
        virtual void begin (const transaction &, list<signature_slot>) = 0;

        virtual bytes sign (const transaction &, uint32 signature_index, uint64 key_index) = 0;

        virtual ~signer () {}
    };

    // every output with the amount in coins and the miner fee, one per line,
    // so that the user can compare them with what the device shows.
    std::ostream &write_details (std::ostream &, const transaction &);

    // signs with keys derived from a seed.
    struct seed_signer final : signer {
        seed Seed;

        // current block height, which determines the signature hash.
        uint64 Height;

        // asked once for every transaction.
        confirmation Confirm;

        seed_signer (const seed &s, uint64 height, confirmation c) : Seed {s}, Height {height}, Confirm {c} {}

        secp256k1::pubkey public_key (uint64 key_index) final override;
        void begin (const transaction &, list<signature_slot>) final override;
        bytes sign (const transaction &, uint32 signature_index, uint64 key_index) final override;
    };

    // a hardware signer. The device computes signature hashes itself and shows
    // everything that it signs to the user.
    struct device {
        // the device derives the key and shows the address.
        virtual entry<unlock_hash, secp256k1::pubkey> get_address (uint32 key_index) = 0;

        // throws user_cancelled if the user rejects and signer_unavailable
        // if the device cannot be reached.
        virtual bytes sign_transaction (const transaction &, uint16 signature_index, uint32 key_index) = 0;

        virtual ~device () {}
    };

    struct device_signer final : signer {
        ptr<device> Device;

        // where we tell the user what to check on the device.
        std::ostream &Out;

        device_signer (ptr<device> d, std::ostream &o = std::cout) : Device {d}, Out {o} {}

        secp256k1::pubkey public_key (uint64 key_index) final override;
        void begin (const transaction &, list<signature_slot>) final override;
        bytes sign (const transaction &, uint32 signature_index, uint64 key_index) final override;
    };

}

#endif
