#include <Walrus/wallet/change.hpp>

namespace Walrus {

    uint64 next_unused_index (ledger &l) {
        list<unlock_hash> addrs = l.addresses ();
        if (data::size (addrs) == 0) return 0;

        uint64 max = 0;
        for (const unlock_hash &a : addrs) max = std::max (max, l.address_info (a).KeyIndex);
        return max + 1;
    }

    seed_address_info generate_address (ledger &l, signer &s, uint64 key_index, const confirmation &confirm) {
        seed_address_info info {unlock_conditions::standard (s.public_key (key_index)), key_index};

        std::stringstream prompt;
        prompt << "Derived address " << info.address () << " with key index " << key_index << ". Is this correct?";
        if (!confirm (prompt.str ())) throw exception (problem::user_cancelled) << "address rejected";

        l.watch_address (info);
        return info;
    }

    unlock_hash change_allocator::operator () (const maybe<std::string> &preconfigured) const {
        if (bool (preconfigured)) return unlock_hash::read (*preconfigured);
        return generate_address (Ledger, Signer (), next_unused_index (Ledger), Confirm).address ();
    }

}
