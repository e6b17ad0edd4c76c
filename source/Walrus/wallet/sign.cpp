#include <Walrus/wallet/sign.hpp>

namespace Walrus {

    owned owned_keys (ledger &l, const transaction &t) {
        list<unlock_hash> watched = l.addresses ();

        owned keys {};
        for (const input &in : t.Inputs) {
            unlock_hash a = in.UnlockConditions.address ();
            if (keys.contains (a)) continue;

            bool ours = false;
            for (const unlock_hash &w : watched) if (w == a) {
                ours = true;
                break;
            }

            if (ours) keys = keys.insert (a, l.address_info (a).KeyIndex);
        }

        return keys;
    }

    namespace {
        bool already_signed (const transaction &t, const output_id &parent) {
            for (const transaction_signature &sig : t.Signatures) if (sig.ParentID == parent) return true;
            return false;
        }
    }

    signed_transaction sign (const transaction &draft, const owned &keys, signer &s) {
        list<transaction_signature> signatures = draft.Signatures;
        list<signature_slot> slots {};

        uint32 input_index = 0;
        uint32 signature_index = data::size (draft.Signatures);
        for (const input &in : draft.Inputs) {
            if (auto key = keys.contains (in.UnlockConditions.address ()); bool (key) && !already_signed (draft, in.ParentID)) {
                signatures <<= transaction_signature::standard (in.ParentID);
                slots <<= signature_slot {input_index, signature_index++, *key};
            }

            input_index++;
        }

        if (data::size (slots) == 0) return signed_transaction {draft, {}};

        // we work on a copy so that nothing is kept if anything goes wrong.
        transaction t {draft.Inputs, draft.Outputs, draft.MinerFees, signatures};

        s.begin (t, slots);

        for (const signature_slot &slot : slots)
            t = t.sign (slot.SignatureIndex, s.sign (t, slot.SignatureIndex, slot.KeyIndex));

        return signed_transaction {t, slots};
    }

    const transaction &broadcastable (const signed_transaction &s) {
        if (s.nothing_to_sign ()) throw exception (problem::invalid_input) <<
            "nothing was signed, so the transaction will not be broadcast";
        return s.Transaction;
    }

}
