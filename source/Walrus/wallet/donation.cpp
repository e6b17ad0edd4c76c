#include <Walrus/wallet/donation.hpp>

namespace Walrus {

    currency donation (const currency &payment, const maybe<unlock_hash> &donation_address) {
        if (!bool (donation_address)) return currency {};
        return max (payment.mul_ratio (options::DonationRate[0], options::DonationRate[1]),
            currency::coins (options::MinDonationCoins));
    }

    funded fund_with_donation (
        const currency &payment,
        const currency &donation,
        const currency &fee_per_byte,
        list<valued_input> available,
        uint32 recipients,
        tx_size size) {

        if (donation.zero ()) return funded {select (payment, fee_per_byte, available, recipients, size), currency {}, false};

        try {
            return funded {select (payment + donation, fee_per_byte, available, recipients + 1, size), donation, false};
        } catch (const data::exception &x) {
            if (!is (x, problem::insufficient_funds)) throw;
        }

        // the change output of this selection becomes the donation output.
        selected without = select (payment, fee_per_byte, available, recipients, size);
        currency leftover = without.Change;
        without.Change = currency {};
        return funded {without, leftover, true};
    }

}
