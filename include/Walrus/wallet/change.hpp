#ifndef WALRUS_WALLET_CHANGE
#define WALRUS_WALLET_CHANGE

#include <Walrus/wallet/signer.hpp>
#include <Walrus/network.hpp>

namespace Walrus {

    // one more than the largest key index of any watched address, or zero.
    uint64 next_unused_index (ledger &);

    // derive the address at the given index, ask the user to confirm it
    // and tell the ledger to watch it. Throws user_cancelled if the user declines.
    seed_address_info generate_address (ledger &, signer &, uint64 key_index, const confirmation &);

    // provides an address for change.
    struct change_allocator {
        ledger &Ledger;

        // called only if a new address must be derived.
        data::function<signer &()> Signer;

        confirmation Confirm;

        // If an address is given, it is checked and returned as is. Otherwise
        // a new address is generated at the next unused index.
        unlock_hash operator () (const maybe<std::string> &preconfigured) const;
    };
}

#endif
