#ifndef WALRUS_WALLET_SIGN
#define WALRUS_WALLET_SIGN

#include <Walrus/wallet/signer.hpp>
#include <Walrus/network.hpp>

namespace Walrus {

    struct signed_transaction {
        transaction Transaction;

        // one for every signature added, in order of input.
        list<signature_slot> Slots;

        // no inputs belong to us. This is not an error.
        bool nothing_to_sign () const {
            return data::size (Slots) == 0;
        }
    };

    // key indices of our addresses, by address.
    using owned = map<unlock_hash, uint64>;

    // find which inputs of a transaction spend from addresses that the ledger watches.
    owned owned_keys (ledger &, const transaction &);

    // Add a signature for every input that spends from one of our addresses and
    // has not been signed already, and get it signed. If the signer fails or the
    // user cancels, the exception propagates and no signatures are kept.
    signed_transaction sign (const transaction &, const owned &, signer &);

    // the transaction to send to the ledger. If we signed nothing, the ledger
    // would reject it, so we throw invalid_input instead.
    const transaction &broadcastable (const signed_transaction &);
}

#endif
