#include <Walrus/transaction.hpp>
#include <Walrus/files.hpp>
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace Walrus {

    namespace {
        // one input from key 0 of the test seed, payment and change.
        transaction test_transaction () {
            seed s = test_seed ();
            return transaction {
                {input {test_id (1), unlock_conditions::standard (s.public_key (0))}},
                {output {currency::coins (1), test_address (1)}, output {currency::read_coins ("0.25"), s.address (1)}},
                {currency {410}}};
        }
    }

    TEST (Transaction, Empty) {
        transaction t {};
        // four empty lists.
        EXPECT_EQ (t.size (), 32);
        EXPECT_EQ (t.fee (), currency {});
        EXPECT_EQ (t.write (), test_bytes (32, 0));
    }

    TEST (Transaction, JSON) {
        transaction t = test_transaction ();
        JSON j = JSON (t);

        EXPECT_EQ (j["inputs"].size (), 1);
        EXPECT_EQ (j["outputs"].size (), 2);
        EXPECT_EQ (j["minerFees"][0], "410");
        EXPECT_EQ (j["signatures"].size (), 0);
        EXPECT_EQ (transaction {j}, t);

        transaction u = t;
        u.Signatures <<= transaction_signature::standard (test_id (1));
        u = u.sign (0, test_bytes (64, 7));
        JSON k = JSON (u);
        EXPECT_EQ (k["signatures"][0]["coveredFields"]["wholeTransaction"], true);
        EXPECT_EQ (k["signatures"][0]["signature"], encoding::hex::write (test_bytes (64, 7)));
        EXPECT_EQ (transaction {k}, u);

        EXPECT_THROW (transaction {JSON ("transaction")}, data::exception);
        EXPECT_THROW (transaction {JSON {{"inputs", JSON::array_t {}}}}, data::exception);
    }

    TEST (Transaction, File) {
        filepath p = std::filesystem::temp_directory_path () / "walrus_test_transaction.json";
        transaction t = test_transaction ();

        write_transaction (p, t);
        EXPECT_EQ (read_transaction (p), t);
        std::filesystem::remove (p);

        EXPECT_THROW (read_transaction (p), data::exception);
        EXPECT_EQ (signed_filepath ("txn.json"), filepath {"txn-signed.json"});
        EXPECT_EQ (signed_filepath ("dir/txn"), filepath {"dir/txn-signed"});
    }

    TEST (Transaction, ID) {
        transaction t = test_transaction ();
        TXID id = t.id ();

        // signatures are not covered.
        transaction u = t;
        u.Signatures <<= transaction_signature::standard (test_id (1));
        EXPECT_EQ (u.id (), id);
        EXPECT_EQ (u.sign (0, test_bytes (64, 1)).id (), id);
        EXPECT_NE (u.write (), t.write ());

        // everything else is.
        transaction v = t;
        v.MinerFees = {currency {411}};
        EXPECT_NE (v.id (), id);
    }

    TEST (Transaction, SigHash) {
        transaction t = test_transaction ();
        EXPECT_THROW (t.sig_hash (0, 200000), data::exception);

        t.Signatures <<= transaction_signature::standard (test_id (1));

        EXPECT_EQ (transaction::replay_prefix (options::HardforkHeight - 1), 0);
        EXPECT_EQ (transaction::replay_prefix (options::HardforkHeight), 1);

        EXPECT_NE (t.sig_hash (0, options::HardforkHeight - 1), t.sig_hash (0, options::HardforkHeight));
        EXPECT_EQ (t.sig_hash (0, options::HardforkHeight), t.sig_hash (0, options::HardforkHeight + 1000));

        // the signature itself is not covered.
        EXPECT_EQ (t.sign (0, test_bytes (64, 1)).sig_hash (0, 200000), t.sig_hash (0, 200000));

        transaction_signature partial = transaction_signature::standard (test_id (1));
        partial.WholeTransaction = false;
        transaction p = test_transaction ();
        p.Signatures <<= partial;
        EXPECT_THROW (p.sig_hash (0, 200000), data::exception);
    }

    TEST (Transaction, Verify) {
        seed s = test_seed ();
        uint64 height = 200000;

        transaction t = test_transaction ();
        t.Signatures <<= transaction_signature::standard (test_id (1));
        EXPECT_FALSE (t.verify (0, height));

        transaction signed_tx = t.sign (0, bytes (s.secret_key (0).sign (t.sig_hash (0, height))));
        EXPECT_TRUE (signed_tx.verify (0, height));

        // wrong height, wrong key, no such signature.
        EXPECT_FALSE (signed_tx.verify (0, options::HardforkHeight - 1));
        EXPECT_FALSE (t.sign (0, bytes (s.secret_key (1).sign (t.sig_hash (0, height)))).verify (0, height));
        EXPECT_FALSE (signed_tx.verify (1, height));

        EXPECT_THROW (t.sign (1, test_bytes (64, 1)), data::exception);
    }

    TEST (Transaction, EstimatedSize) {
        EXPECT_EQ (transaction::estimated_size (0, 0), 56);
        EXPECT_EQ (transaction::estimated_size (1, 1), 354);
        EXPECT_EQ (transaction::estimated_size (3, 2), 894);

        seed s = test_seed ();
        transaction t = test_transaction ();
        t.Signatures <<= transaction_signature::standard (test_id (1));
        transaction signed_tx = t.sign (0, bytes (s.secret_key (0).sign (t.sig_hash (0, 200000))));
        EXPECT_LE (signed_tx.size (), transaction::estimated_size (1, 2));
    }

}
