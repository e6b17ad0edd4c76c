#ifndef WALRUS_WALLET_DONATION
#define WALRUS_WALLET_DONATION

#include <Walrus/wallet/select.hpp>

namespace Walrus {

    // one percent of the payment but at least ten coins,
    // or nothing if there is no donation address.
    currency donation (const currency &payment, const maybe<unlock_hash> &donation_address);

    struct funded {
        selected Selection;
        // zero if there is no donation output.
        currency Donation;

        // true if the donation had to be reduced to the leftover change.
        bool Reduced;
    };

    // Fund a payment to the given number of recipients together with a donation.
    // If there are not enough funds to pay the full donation, select again for the
    // payment alone and donate whatever would have gone to change instead.
    funded fund_with_donation (
        const currency &payment,
        const currency &donation,
        const currency &fee_per_byte,
        list<valued_input> available,
        uint32 recipients,
        tx_size size = &standard_size);
}

#endif
