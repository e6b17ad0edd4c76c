#include <Walrus/wallet/spend.hpp>

namespace Walrus {

    spend::spent spend::operator () (
        list<output> to,
        const maybe<unlock_hash> &donation_address,
        const maybe<std::string> &change_address) const {

        if (data::size (to) == 0) throw exception (problem::invalid_input) << "no outputs to pay";

        currency payment {};
        for (const output &o : to) payment += o.Value;

        currency fee_per_byte = Ledger.recommended_fee ();
        list<valued_input> available = to_inputs (Ledger.unspent_outputs (ConfirmedOnly));

        funded f = fund_with_donation (payment, donation (payment, donation_address),
            fee_per_byte, available, data::size (to), Size);

        list<output> outputs = to;
        if (!f.Donation.zero ()) outputs <<= output {f.Donation, *donation_address};

        maybe<unlock_hash> change_to {};
        if (!f.Selection.Change.zero ()) {
            change_to = Change (change_address);
            outputs <<= output {f.Selection.Change, *change_to};
        }

        return spent {
            transaction {f.Selection.inputs (), outputs, {f.Selection.Fee}},
            f.Selection.Used, payment, f.Donation, f.Reduced, f.Selection.Change, change_to};
    }

    spend::spent spend::split (uint32 n, const currency &per_output, const maybe<std::string> &change_address) const {
        currency fee_per_byte = Ledger.recommended_fee ();
        list<valued_input> available = to_inputs (Ledger.unspent_outputs (ConfirmedOnly));

        selected s = Walrus::split (n, per_output, fee_per_byte, available, Size);

        // the split outputs and the change all go to the same address.
        unlock_hash destination = Change (change_address);

        return spent {
            transaction {s.inputs (), split_outputs (n, per_output, s.Change, destination), {s.Fee}},
            s.Used, per_output * n, currency {}, false, s.Change, destination};
    }

}
