#include <Walrus/transaction.hpp>
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace Walrus {

    namespace {
        bytes hex (const std::string &x) {
            maybe<bytes> b = encoding::hex::read (x);
            if (!bool (b)) throw data::exception {} << "invalid hex " << x;
            return *b;
        }
    }

    TEST (Encoding, Primitives) {
        encoder e {};
        e << uint64 {258} << byte (7) << hex ("abcdef");
        e.specifier ("ed25519");
        EXPECT_EQ (e.complete (), hex (
            "0201000000000000"
            "07"
            "0300000000000000" "abcdef"
            "65643235353139000000000000000000"));

        encoder d {};
        d << test_id (1);
        EXPECT_EQ (d.complete (), hex (write (test_id (1))));
    }

    TEST (Encoding, UnlockConditions) {
        seed s = test_seed ();
        secp256k1::pubkey p = s.public_key (0);
        EXPECT_EQ (bytes (p).size (), 33);

        encoder e {};
        e << unlock_conditions::standard (p);
        bytes expected = hex (std::string {
            "0000000000000000"
            "0100000000000000"
            "736563703235366b3100000000000000"
            "2100000000000000"} + encoding::hex::write (bytes (p)) +
            "0100000000000000");

        bytes encoded = e.complete ();
        EXPECT_EQ (encoded, expected);
        EXPECT_EQ (unlock_conditions::standard (p).address ().Hash, Gigamonkey::SHA2_256 (expected));
    }

    TEST (Encoding, Transaction) {
        transaction t {{}, {output {currency {1000}, unlock_hash {test_id (1)}}}, {currency {410}}};

        std::string body = std::string {
            "0000000000000000"
            "0100000000000000"
            "0200000000000000" "03e8"} + write (test_id (1)) +
            "0100000000000000"
            "0200000000000000" "019a";

        EXPECT_EQ (t.write (), hex (body + "0000000000000000"));
        EXPECT_EQ (t.id (), Gigamonkey::SHA2_256 (hex (body)));

        // replay prefix, body, then the fields of the signature.
        t.Signatures <<= transaction_signature {test_id (2), 3, 0, true, {}};
        EXPECT_EQ (t.sig_hash (0, 200000), Gigamonkey::SHA2_256 (hex ("01" + body + write (test_id (2)) +
            "0300000000000000" "0000000000000000")));
        EXPECT_EQ (t.sig_hash (0, 100), Gigamonkey::SHA2_256 (hex ("00" + body + write (test_id (2)) +
            "0300000000000000" "0000000000000000")));
    }

}
