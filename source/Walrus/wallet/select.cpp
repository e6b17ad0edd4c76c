#include <Walrus/wallet/select.hpp>

namespace Walrus {

    list<valued_input> to_inputs (list<utxo> u) {
        return data::for_each ([] (const utxo &x) -> valued_input {
            return valued_input {x};
        }, u);
    }

    currency total_value (list<valued_input> v) {
        currency total {};
        for (const valued_input &x : v) total += x.Value;
        return total;
    }

    currency selected::value () const {
        return total_value (Used);
    }

    list<input> selected::inputs () const {
        return data::for_each ([] (const valued_input &x) -> input {
            return input (x);
        }, Used);
    }

    selected select (
        const currency &target,
        const currency &fee_per_byte,
        list<valued_input> available,
        uint32 outputs,
        tx_size size) {

        cross<valued_input> ordered (available);
        std::sort (ordered.begin (), ordered.end (), [] (const valued_input &a, const valued_input &b) -> bool {
            return a.Value > b.Value || (a.Value == b.Value && a.ParentID < b.ParentID);
        });

        list<valued_input> used {};
        currency accumulated {};
        currency fee {};
        uint32 count = 0;

        for (const valued_input &v : ordered) {
            used <<= v;
            accumulated += v.Value;
            count++;

            fee = fee_per_byte * size (count, outputs);
            if (accumulated >= target + fee) break;
        }

        if (count == 0 || accumulated < target + fee) throw exception (problem::insufficient_funds) <<
            "insufficient funds: need " << (target + fee) << " but only " << accumulated << " is available";

        currency change = accumulated - target - fee;
        if (change.zero ()) return selected {used, fee, change};

        // pay for a change output if we can.
        currency fee_with_change = fee_per_byte * size (count, outputs + 1);
        if (accumulated >= target + fee_with_change)
            return selected {used, fee_with_change, accumulated - target - fee_with_change};

        return selected {used, accumulated - target, currency {}};
    }

}
