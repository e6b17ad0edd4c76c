#include <Walrus/address.hpp>

namespace Walrus {

    maybe<digest256> read_digest (string_view x) {
        if (x.size () != 64) return {};
        maybe<bytes> b = encoding::hex::read (std::string {x});
        if (!bool (b) || b->size () != 32) return {};
        digest256 d {};
        std::copy (b->begin (), b->end (), d.begin ());
        return d;
    }

    namespace {
        constexpr uint32 ChecksumSize {6};

        // the first bytes of the hash of the hash.
        std::string checksum (const digest256 &d) {
            encoder e {};
            e << d;
            return data::to_lower (encoding::hex::write (Gigamonkey::SHA2_256 (e.complete ()))).substr (0, 2 * ChecksumSize);
        }
    }

    std::string unlock_hash::write () const {
        return data::to_lower (Walrus::write (Hash)) + checksum (Hash);
    }

    bool unlock_hash::valid (string_view x) {
        if (x.size () != Size) return false;
        maybe<digest256> d = read_digest (x.substr (0, 64));
        if (!bool (d)) return false;

        return data::to_lower (std::string {x.substr (64)}) == checksum (*d);
    }

    unlock_hash unlock_hash::read (string_view x) {
        if (x.size () != Size) throw exception (problem::invalid_input) <<
            "invalid address \"" << x << "\": expected " << Size << " characters";

        if (!valid (x)) throw exception (problem::invalid_input) << "invalid address \"" << x << "\": bad checksum";

        return unlock_hash {*read_digest (x.substr (0, 64))};
    }

    encoder &operator << (encoder &e, const unlock_conditions &u) {
        e << u.Timelock << uint64 (data::size (u.PublicKeys));
        for (const secp256k1::pubkey &p : u.PublicKeys) e.specifier ("secp256k1") << bytes (p);
        return e << u.SignaturesRequired;
    }

    unlock_hash unlock_conditions::address () const {
        encoder e {};
        e << *this;
        return unlock_hash {Gigamonkey::SHA2_256 (e.complete ())};
    }

    namespace {
        constexpr const char *KeyPrefix {"secp256k1:"};

        secp256k1::pubkey read_pubkey (const std::string &x) {
            std::string prefix {KeyPrefix};
            if (x.substr (0, prefix.size ()) != prefix)
                throw exception (problem::invalid_input) << "unsupported public key \"" << x << "\"";

            maybe<bytes> b = encoding::hex::read (x.substr (prefix.size ()));
            if (!bool (b)) throw exception (problem::invalid_input) << "invalid public key \"" << x << "\"";

            secp256k1::pubkey p {*b};
            if (!p.valid ()) throw exception (problem::invalid_input) << "invalid public key \"" << x << "\"";
            return p;
        }
    }

    unlock_conditions::unlock_conditions (const JSON &j) : unlock_conditions {} {
        if (!j.is_object () || !j.contains ("publicKeys") || !j["publicKeys"].is_array ())
            throw exception (problem::invalid_input) << "invalid unlock conditions " << j.dump ();

        if (j.contains ("timelock")) Timelock = uint64 (j["timelock"]);
        if (j.contains ("signaturesRequired")) SignaturesRequired = uint64 (j["signaturesRequired"]);
        for (const JSON &k : j["publicKeys"]) {
            if (!k.is_string ()) throw exception (problem::invalid_input) << "invalid public key " << k.dump ();
            PublicKeys <<= read_pubkey (std::string (k));
        }
    }

    unlock_conditions::operator JSON () const {
        JSON::array_t keys;
        for (const secp256k1::pubkey &p : PublicKeys)
            keys.push_back (std::string {KeyPrefix} + encoding::hex::write (bytes (p)));

        return JSON {
            {"timelock", Timelock},
            {"publicKeys", keys},
            {"signaturesRequired", SignaturesRequired}};
    }

}
