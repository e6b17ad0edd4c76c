#ifndef WALRUS_WALLET_SPEND
#define WALRUS_WALLET_SPEND

#include <Walrus/wallet/donation.hpp>
#include <Walrus/wallet/split.hpp>
#include <Walrus/wallet/change.hpp>

namespace Walrus {

    // produce an unsigned transaction.
    struct spend {
        ledger &Ledger;

        change_allocator Change;

        tx_size Size {&standard_size};

        // if true, spend only outputs that have been confirmed.
        bool ConfirmedOnly {false};

        struct spent {
            transaction Transaction;

            // the inputs of the transaction, with values.
            list<valued_input> Used;

            currency Payment;
            currency Donation;

            // true if there was not enough to pay the full donation.
            bool DonationReduced;

            currency Change;
            maybe<unlock_hash> ChangeAddress;

            currency fee () const {
                return Transaction.fee ();
            }
        };

        // pay to the given outputs, with a donation if an address is provided.
        spent operator () (
            list<output> to,
            const maybe<unlock_hash> &donation_address,
            const maybe<std::string> &change_address) const;

        // n outputs of equal value to a new address of ours.
        spent split (uint32 n, const currency &per_output, const maybe<std::string> &change_address) const;
    };

}

#endif
