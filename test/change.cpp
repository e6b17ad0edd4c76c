#include <Walrus/wallet/change.hpp>
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace Walrus {

    TEST (Change, NextUnusedIndex) {
        seed s = test_seed ();
        fake_ledger l {};
        EXPECT_EQ (next_unused_index (l), 0);

        l.fund (s, 0, test_id (1), currency {100});
        EXPECT_EQ (next_unused_index (l), 1);

        l.fund (s, 4, test_id (2), currency {100});
        l.fund (s, 2, test_id (3), currency {100});
        EXPECT_EQ (next_unused_index (l), 5);
    }

    TEST (Change, GenerateAddress) {
        seed s = test_seed ();
        fake_ledger l {};
        seed_signer hot {s, l.Height, always_yes ()};

        seed_address_info info = generate_address (l, hot, 7, always_yes ());
        EXPECT_EQ (info.KeyIndex, 7);
        EXPECT_EQ (info.address (), s.address (7));
        EXPECT_EQ (l.address_info (s.address (7)).KeyIndex, 7);

        try {
            generate_address (l, hot, 8, always_no ());
            FAIL () << "address should have been rejected";
        } catch (const data::exception &x) {
            EXPECT_TRUE (is (x, problem::user_cancelled));
        }

        // nothing was registered.
        EXPECT_EQ (data::size (l.addresses ()), 1);
    }

    TEST (Change, Device) {
        seed s = test_seed ();
        fake_ledger l {};

        auto dev = std::make_shared<fake_device> (s, l.Height);
        device_signer cold {dev};

        EXPECT_EQ (generate_address (l, cold, 2, always_yes ()).address (), s.address (2));

        dev->Mismatch = true;
        try {
            generate_address (l, cold, 3, always_yes ());
            FAIL () << "mismatched address was accepted";
        } catch (const data::exception &x) {
            EXPECT_TRUE (is (x, problem::signer_unavailable));
        }

        EXPECT_EQ (data::size (l.addresses ()), 1);
    }

    TEST (Change, Allocator) {
        seed s = test_seed ();
        fake_ledger l {};
        l.fund (s, 0, test_id (1), currency {100});

        seed_signer hot {s, l.Height, always_yes ()};
        uint32 acquired = 0;
        change_allocator allocate {l, [&] () -> signer & {
            acquired++;
            return hot;
        }, always_yes ()};

        // a preconfigured address is returned as is.
        unlock_hash preconfigured = test_address (4);
        EXPECT_EQ (allocate (preconfigured.write ()), preconfigured);
        EXPECT_EQ (acquired, 0);
        EXPECT_EQ (data::size (l.addresses ()), 1);

        try {
            allocate (std::string {"not an address"});
            FAIL () << "invalid address was accepted";
        } catch (const data::exception &x) {
            EXPECT_TRUE (is (x, problem::invalid_input));
        }

        // otherwise a new address is generated and watched.
        EXPECT_EQ (allocate ({}), s.address (1));
        EXPECT_EQ (acquired, 1);
        EXPECT_EQ (l.address_info (s.address (1)).KeyIndex, 1);
    }

}
