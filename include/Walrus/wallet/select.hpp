#ifndef WALRUS_WALLET_SELECT
#define WALRUS_WALLET_SELECT

#include <Walrus/network.hpp>

namespace Walrus {

    // an unspent output staged for one funding attempt.
    struct valued_input {
        output_id ParentID;
        unlock_conditions UnlockConditions;
        currency Value;

        valued_input (const output_id &id, const unlock_conditions &u, const currency &v) :
            ParentID {id}, UnlockConditions {u}, Value {v} {}

        explicit valued_input (const utxo &u) :
            ParentID {u.ID}, UnlockConditions {u.UnlockConditions}, Value {u.Value} {}

        explicit operator input () const {
            return input {ParentID, UnlockConditions};
        }

        bool operator == (const valued_input &v) const {
            return ParentID == v.ParentID && UnlockConditions == v.UnlockConditions && Value == v.Value;
        }
    };

    list<valued_input> to_inputs (list<utxo>);

    // expected size of a transaction in bytes, given the number of inputs and outputs.
    using tx_size = data::function<uint64 (uint32 inputs, uint32 outputs)>;

    uint64 inline standard_size (uint32 inputs, uint32 outputs) {
        return transaction::estimated_size (inputs, outputs);
    }

    struct selected {
        // in the order in which they were selected.
        list<valued_input> Used;
        currency Fee;
        // zero if there is no change output.
        currency Change;

        currency value () const;

        list<input> inputs () const;
    };

    // Choose inputs to pay the target value to the given number of outputs plus
    // a fee proportional to the expected size of the transaction. Inputs are taken
    // greedily in order of decreasing value, with ties broken by increasing parent id.
    // If there is value left over, the fee is computed again for a transaction
    // with an extra change output. If the inputs are not enough to pay for the change
    // output, there is no change and the extra value goes to the fee.
    //
    // The value of the inputs used is always Target + Fee + Change.
    // Throws insufficient_funds if the inputs are not enough.
    selected select (
        const currency &target,
        const currency &fee_per_byte,
        list<valued_input> available,
        uint32 outputs,
        tx_size size = &standard_size);

    currency total_value (list<valued_input>);
}

#endif
