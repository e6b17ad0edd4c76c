#include <Walrus/transaction.hpp>
#include <Walrus/options.hpp>

namespace Walrus {

    namespace {

        encoder &operator << (encoder &e, const currency &c) {
            return e << c.big_endian ();
        }

        encoder &operator << (encoder &e, const input &in) {
            return e << in.ParentID << in.UnlockConditions;
        }

        encoder &operator << (encoder &e, const output &out) {
            return e << out.Value << out.UnlockHash.Hash;
        }

        encoder &operator << (encoder &e, const transaction_signature &sig) {
            return e << sig.ParentID << sig.PublicKeyIndex << sig.Timelock <<
                byte (sig.WholeTransaction ? 1 : 0) << sig.Signature;
        }

        // everything but the signatures.
        encoder &write_body (encoder &e, const transaction &t) {
            e << uint64 (data::size (t.Inputs));
            for (const input &in : t.Inputs) e << in;

            e << uint64 (data::size (t.Outputs));
            for (const output &out : t.Outputs) e << out;

            e << uint64 (data::size (t.MinerFees));
            for (const currency &fee : t.MinerFees) e << fee;

            return e;
        }

        digest256 read_id (const JSON &j, const char *name) {
            if (!j.contains (name) || !j[name].is_string ())
                throw exception (problem::invalid_input) << "missing field " << name;

            maybe<digest256> d = read_digest (std::string (j[name]));
            if (!bool (d)) throw exception (problem::invalid_input) << "invalid " << name << " " << j[name].dump ();
            return *d;
        }

        const JSON &read_array (const JSON &j, const char *name) {
            if (!j.contains (name) || !j[name].is_array ())
                throw exception (problem::invalid_input) << "expected array " << name;
            return j[name];
        }
    }

    bytes transaction::write () const {
        encoder e {};
        write_body (e, *this);
        e << uint64 (data::size (Signatures));
        for (const transaction_signature &sig : Signatures) e << sig;
        return e.complete ();
    }

    TXID transaction::id () const {
        encoder e {};
        return Gigamonkey::SHA2_256 (write_body (e, *this).complete ());
    }

    byte transaction::replay_prefix (uint64 height) {
        return height < options::HardforkHeight ? byte (0) : byte (1);
    }

    digest256 transaction::sig_hash (uint32 signature_index, uint64 height) const {
        if (signature_index >= data::size (Signatures))
            throw exception (problem::unknown) << "no signature at index " << signature_index;

        const transaction_signature &sig = Signatures[signature_index];
        if (!sig.WholeTransaction) throw exception (problem::unknown) << "only whole transaction signatures are supported";

        encoder e {};
        e << replay_prefix (height);
        write_body (e, *this);
        e << sig.ParentID << sig.PublicKeyIndex << sig.Timelock;
        return Gigamonkey::SHA2_256 (e.complete ());
    }

    bool transaction::verify (uint32 signature_index, uint64 height) const {
        if (signature_index >= data::size (Signatures)) return false;
        const transaction_signature &sig = Signatures[signature_index];
        if (sig.Signature.size () == 0) return false;

        for (const input &in : Inputs) if (in.ParentID == sig.ParentID) {
            if (sig.PublicKeyIndex >= data::size (in.UnlockConditions.PublicKeys)) return false;
            const secp256k1::pubkey &key = in.UnlockConditions.PublicKeys[sig.PublicKeyIndex];
            return key.verify (sig_hash (signature_index, height), secp256k1::signature {sig.Signature});
        }

        return false;
    }

    currency transaction::fee () const {
        currency total {};
        for (const currency &fee : MinerFees) total += fee;
        return total;
    }

    transaction transaction::sign (uint32 signature_index, const bytes &signature) const {
        if (signature_index >= data::size (Signatures))
            throw exception (problem::unknown) << "no signature at index " << signature_index;

        list<transaction_signature> signatures;
        uint32 index = 0;
        for (transaction_signature sig : Signatures) {
            if (index++ == signature_index) sig.Signature = signature;
            signatures <<= sig;
        }

        return transaction {Inputs, Outputs, MinerFees, signatures};
    }

    input::operator JSON () const {
        return JSON {
            {"parentID", Walrus::write (ParentID)},
            {"unlockConditions", JSON (UnlockConditions)}};
    }

    output::operator JSON () const {
        return JSON {
            {"value", JSON (Value)},
            {"unlockHash", JSON (UnlockHash)}};
    }

    transaction_signature::operator JSON () const {
        return JSON {
            {"parentID", Walrus::write (ParentID)},
            {"publicKeyIndex", PublicKeyIndex},
            {"timelock", Timelock},
            {"coveredFields", JSON {{"wholeTransaction", WholeTransaction}}},
            {"signature", encoding::hex::write (Signature)}};
    }

    input read_input (const JSON &j) {
        if (!j.is_object () || !j.contains ("unlockConditions"))
            throw exception (problem::invalid_input) << "invalid input " << j.dump ();
        return input {read_id (j, "parentID"), unlock_conditions {j["unlockConditions"]}};
    }

    output read_output (const JSON &j) {
        if (!j.is_object () || !j.contains ("value") || !j.contains ("unlockHash"))
            throw exception (problem::invalid_input) << "invalid output " << j.dump ();
        return output {currency {j["value"]}, unlock_hash {j["unlockHash"]}};
    }

    transaction_signature read_signature (const JSON &j) {
        if (!j.is_object ()) throw exception (problem::invalid_input) << "invalid signature " << j.dump ();

        transaction_signature sig = transaction_signature::standard (read_id (j, "parentID"));
        if (j.contains ("publicKeyIndex")) sig.PublicKeyIndex = uint64 (j["publicKeyIndex"]);
        if (j.contains ("timelock")) sig.Timelock = uint64 (j["timelock"]);
        if (j.contains ("coveredFields")) sig.WholeTransaction = bool (j["coveredFields"].value ("wholeTransaction", false));

        if (j.contains ("signature") && j["signature"].is_string ()) {
            maybe<bytes> b = encoding::hex::read (std::string (j["signature"]));
            if (!bool (b)) throw exception (problem::invalid_input) << "invalid signature " << j["signature"].dump ();
            sig.Signature = *b;
        }

        return sig;
    }

    transaction::transaction (const JSON &j) : transaction {} {
        if (!j.is_object ()) throw exception (problem::invalid_input) << "expected a transaction object";

        for (const JSON &in : read_array (j, "inputs")) Inputs <<= read_input (in);
        for (const JSON &out : read_array (j, "outputs")) Outputs <<= read_output (out);
        for (const JSON &fee : read_array (j, "minerFees")) MinerFees <<= currency {fee};
        for (const JSON &sig : read_array (j, "signatures")) Signatures <<= read_signature (sig);
    }

    transaction::operator JSON () const {
        JSON::array_t inputs;
        for (const input &in : Inputs) inputs.push_back (JSON (in));

        JSON::array_t outputs;
        for (const output &out : Outputs) outputs.push_back (JSON (out));

        JSON::array_t fees;
        for (const currency &fee : MinerFees) fees.push_back (JSON (fee));

        JSON::array_t signatures;
        for (const transaction_signature &sig : Signatures) signatures.push_back (JSON (sig));

        return JSON {
            {"inputs", inputs},
            {"outputs", outputs},
            {"minerFees", fees},
            {"signatures", signatures}};
    }

    std::ostream &operator << (std::ostream &o, const transaction &t) {
        return o << "transaction {" << Walrus::write (t.id ()) << ", " << data::size (t.Inputs) << " inputs, " <<
            data::size (t.Outputs) << " outputs, fee " << t.fee () << "}";
    }
}
