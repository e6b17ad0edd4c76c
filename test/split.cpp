#include <Walrus/wallet/split.hpp>
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace Walrus {

    namespace {
        uint64 split_size (uint32 inputs, uint32 outputs) {
            return 50 * inputs + 50 * outputs;
        }

        void expect_problem (problem p, uint32 n, const currency &per_output, list<valued_input> available) {
            try {
                split (n, per_output, currency {2}, available, &split_size);
                FAIL () << "split should have failed";
            } catch (const data::exception &x) {
                EXPECT_TRUE (is (x, p));
            }
        }
    }

    TEST (Split, Insufficient) {
        list<valued_input> available {valued_input {test_id (1), unlock_conditions {}, currency {50}}};
        EXPECT_EQ (split_size (1, 4), 250);
        expect_problem (problem::insufficient_funds, 3, currency {10}, available);
    }

    TEST (Split, Invalid) {
        list<valued_input> available {valued_input {test_id (1), unlock_conditions {}, currency {5000}}};
        expect_problem (problem::invalid_input, 0, currency {10}, available);
        expect_problem (problem::invalid_input, 3, currency {}, available);
    }

    TEST (Split, WithChange) {
        list<valued_input> available {
            valued_input {test_id (1), unlock_conditions {}, currency {300}},
            valued_input {test_id (2), unlock_conditions {}, currency {2000}}};

        selected s = split (3, currency {100}, currency {2}, available, &split_size);

        EXPECT_EQ (data::size (s.Used), 1);
        EXPECT_EQ (s.Used.first ().Value, currency {2000});
        // one input and four outputs, counting change.
        EXPECT_EQ (s.Fee, currency {500});
        EXPECT_EQ (s.Change, currency {1200});
        EXPECT_EQ (s.value (), currency {300} + s.Fee + s.Change);

        unlock_hash to = test_address (3);
        list<output> outputs = split_outputs (3, currency {100}, s.Change, to);
        EXPECT_EQ (data::size (outputs), 4);
        for (const output &o : outputs) EXPECT_EQ (o.UnlockHash, to);
        EXPECT_EQ (outputs.first ().Value, currency {100});
        EXPECT_EQ (outputs[3].Value, currency {1200});
    }

    TEST (Split, NoChange) {
        // 3 * 100 + 2 * (50 + 150)
        list<valued_input> available {valued_input {test_id (1), unlock_conditions {}, currency {700}}};
        selected s = split (3, currency {100}, currency {2}, available, &split_size);

        EXPECT_EQ (s.Fee, currency {400});
        EXPECT_TRUE (s.Change.zero ());
        EXPECT_EQ (data::size (split_outputs (3, currency {100}, s.Change, test_address (3))), 3);
    }

}
