#include <Walrus/wallet/signer.hpp>
#include <Walrus/options.hpp>

namespace Walrus {

    std::ostream &write_details (std::ostream &o, const transaction &t) {
        o << "\t" << data::size (t.Inputs) << " input" << (data::size (t.Inputs) == 1 ? "" : "s") << std::endl;
        for (const output &x : t.Outputs)
            o << "\t" << x.UnlockHash << " receives " << x.Value.in_coins (5) << " SC" << std::endl;
        return o << "\tminer fee: " << t.fee ().in_coins (5) << " SC" << std::endl;
    }

    secp256k1::pubkey seed_signer::public_key (uint64 key_index) {
        return Seed.public_key (key_index);
    }

    void seed_signer::begin (const transaction &, list<signature_slot> slots) {
        std::stringstream prompt;
        prompt << "Sign " << data::size (slots) << " input" << (data::size (slots) == 1 ? "" : "s") << " of this transaction?";
        if (!Confirm (prompt.str ())) throw exception (problem::user_cancelled) << "transaction not signed";
    }

    bytes seed_signer::sign (const transaction &t, uint32 signature_index, uint64 key_index) {
        return bytes (Seed.secret_key (key_index).sign (t.sig_hash (signature_index, Height)));
    }

    namespace {
        uint32 device_key_index (uint64 key_index) {
            if (key_index > options::MaxKeyIndex)
                throw exception (problem::invalid_input) << "key index " << key_index << " is too big for the device";
            return static_cast<uint32> (key_index);
        }
    }

    secp256k1::pubkey device_signer::public_key (uint64 key_index) {
        Out << "Please verify that the address shown on your device matches the address below." << std::endl;
        entry<unlock_hash, secp256k1::pubkey> derived = Device->get_address (device_key_index (key_index));
        if (unlock_conditions::standard (derived.Value).address () != derived.Key)
            throw exception (problem::signer_unavailable) << "device returned a key that does not match its address";
        return derived.Value;
    }

    void device_signer::begin (const transaction &t, list<signature_slot>) {
        Out << "Please verify the transaction details on your device:" << std::endl;
        write_details (Out, t);
    }

    bytes device_signer::sign (const transaction &t, uint32 signature_index, uint64 key_index) {
        if (signature_index > std::numeric_limits<uint16>::max ())
            throw exception (problem::invalid_input) << "too many signatures for the device";

        Out << "Waiting for signature " << signature_index << " with key " << key_index << "..." << std::flush;
        bytes sig = Device->sign_transaction (t, static_cast<uint16> (signature_index), device_key_index (key_index));
        Out << " done." << std::endl;
        return sig;
    }

}
