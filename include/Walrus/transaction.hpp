#ifndef WALRUS_TRANSACTION
#define WALRUS_TRANSACTION

#include <Walrus/currency.hpp>
#include <Walrus/address.hpp>

namespace Walrus {

    struct input {
        output_id ParentID;
        unlock_conditions UnlockConditions;

        bool operator == (const input &i) const {
            return ParentID == i.ParentID && UnlockConditions == i.UnlockConditions;
        }

        explicit operator JSON () const;
    };

    struct output {
        currency Value;
        unlock_hash UnlockHash;

        bool operator == (const output &o) const {
            return Value == o.Value && UnlockHash == o.UnlockHash;
        }

        explicit operator JSON () const;
    };

    struct transaction_signature {
        // the id of the output that the signed input spends.
        output_id ParentID;
        // index of the key in the unlock conditions.
        uint64 PublicKeyIndex;
        uint64 Timelock;
        // we only produce signatures that cover the whole transaction.
        bool WholeTransaction;
        bytes Signature;

        // a whole-transaction signature for the first key, not yet signed.
        static transaction_signature standard (const output_id &);

        bool operator == (const transaction_signature &s) const {
            return ParentID == s.ParentID && PublicKeyIndex == s.PublicKeyIndex &&
                Timelock == s.Timelock && WholeTransaction == s.WholeTransaction && Signature == s.Signature;
        }

        explicit operator JSON () const;
    };

    input read_input (const JSON &);
    output read_output (const JSON &);
    transaction_signature read_signature (const JSON &);

    struct transaction {
        list<input> Inputs;
        list<output> Outputs;
        list<currency> MinerFees;
        list<transaction_signature> Signatures;

        transaction () : Inputs {}, Outputs {}, MinerFees {}, Signatures {} {}
        transaction (list<input> i, list<output> o, list<currency> f, list<transaction_signature> s = {}) :
            Inputs {i}, Outputs {o}, MinerFees {f}, Signatures {s} {}

        // sizes of the parts of a standard transaction, which has a single miner fee,
        // single-key inputs with a signature of the maximum size, and output
        // values of no more than 16 bytes.
        constexpr static uint64 BaseSize {56};
        constexpr static uint64 InputSize {242};
        constexpr static uint64 OutputSize {56};

        static uint64 estimated_size (uint32 inputs, uint32 outputs) {
            return BaseSize + InputSize * inputs + OutputSize * outputs;
        }

        // canonical encoding of the whole transaction.
        bytes write () const;

        uint64 size () const {
            return write ().size ();
        }

        // the id does not cover the signatures.
        TXID id () const;

        // the digest that signature number i signs. Throws if there is no such signature.
        digest256 sig_hash (uint32 signature_index, uint64 height) const;

        // protocol version included in signature hashes at a given height.
        static byte replay_prefix (uint64 height);

        // check signature number i against the key it names.
        bool verify (uint32 signature_index, uint64 height) const;

        currency fee () const;

        // a copy with signature number i filled in.
        transaction sign (uint32 signature_index, const bytes &signature) const;

        bool operator == (const transaction &t) const {
            return Inputs == t.Inputs && Outputs == t.Outputs && MinerFees == t.MinerFees && Signatures == t.Signatures;
        }

        explicit transaction (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const transaction &);

    transaction_signature inline transaction_signature::standard (const output_id &id) {
        return transaction_signature {id, 0, 0, true, {}};
    }
}

#endif
