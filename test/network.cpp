#include <Walrus/network.hpp>
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace Walrus {

    TEST (Network, APIAddress) {
        api_address a = api_address::read ("localhost:9380");
        EXPECT_EQ (a.Scheme, "http");
        EXPECT_EQ (a.Authority, "localhost:9380");
        EXPECT_EQ (a.Path, "");
        EXPECT_EQ (a.write (), "http://localhost:9380");

        api_address b = api_address::read ("https://narwal.example.com/api/wallet/abc123/");
        EXPECT_EQ (b.Scheme, "https");
        EXPECT_EQ (b.Authority, "narwal.example.com");
        EXPECT_EQ (b.Path, "/api/wallet/abc123");

        EXPECT_THROW (api_address::read ("ftp://localhost"), data::exception);
        EXPECT_THROW (api_address::read ("http:///wallet"), data::exception);
        EXPECT_THROW (api_address::read (""), data::exception);
    }

    TEST (Network, DonationEndpoint) {
        maybe<api_address> d = donation_endpoint (api_address::read ("https://narwal.example.com/api/wallet/abc123"));
        ASSERT_TRUE (bool (d));
        EXPECT_EQ (d->write (), "https://narwal.example.com/api/donations");

        maybe<api_address> e = donation_endpoint (api_address::read ("narwal.example.com/wallet/xyz"));
        ASSERT_TRUE (bool (e));
        EXPECT_EQ (e->write (), "http://narwal.example.com/donations");

        // not a narwal wallet.
        EXPECT_FALSE (bool (donation_endpoint (api_address::read ("localhost:9380"))));
        EXPECT_FALSE (bool (donation_endpoint (api_address::read ("localhost:9380/api"))));
        EXPECT_FALSE (bool (donation_endpoint (api_address::read ("localhost:9380/wallets/abc"))));

        // no donation if there is no endpoint.
        EXPECT_FALSE (bool (donation_address (api_address::read ("localhost:9380"))));
    }

    TEST (Network, AddressInfo) {
        seed s = test_seed ();
        seed_address_info info {unlock_conditions::standard (s.public_key (3)), 3};

        JSON j = JSON (info);
        EXPECT_EQ (j["keyIndex"], 3);
        seed_address_info read {j};
        EXPECT_EQ (read.KeyIndex, 3);
        EXPECT_EQ (read.address (), s.address (3));

        EXPECT_THROW (seed_address_info {JSON {{"keyIndex", 3}}}, data::exception);
    }

    TEST (Network, UTXO) {
        seed s = test_seed ();
        utxo u {test_id (5), currency::coins (2), unlock_conditions::standard (s.public_key (1)), 1};
        EXPECT_EQ (u.UnlockHash, s.address (1));

        utxo read {JSON (u)};
        EXPECT_EQ (read.ID, u.ID);
        EXPECT_EQ (read.Value, u.Value);
        EXPECT_EQ (read.UnlockHash, u.UnlockHash);
        EXPECT_EQ (read.KeyIndex, 1);

        // the address may be left out.
        JSON j = JSON (u);
        j.erase ("unlockHash");
        EXPECT_EQ (utxo {j}.UnlockHash, s.address (1));

        j["ID"] = "xyz";
        try {
            utxo bad {j};
            FAIL () << "invalid utxo was accepted";
        } catch (const data::exception &x) {
            EXPECT_TRUE (is (x, problem::remote_error));
        }
    }

    TEST (Network, Broadcast) {
        seed s = test_seed ();
        fake_ledger l {};
        transaction t {
            {input {test_id (1), unlock_conditions::standard (s.public_key (0))}},
            {output {currency::coins (1), test_address (1)}}, {currency {500}}};

        EXPECT_EQ (broadcast (l, t), t.id ());
        EXPECT_EQ (data::size (l.Broadcast), 1);
        EXPECT_EQ (l.transactions (test_address (1), options::DefaultMaxHistory).first (), t.id ());

        l.FailBroadcast = true;
        try {
            broadcast (l, t);
            FAIL () << "broadcast should have failed";
        } catch (const data::exception &x) {
            EXPECT_TRUE (is (x, problem::remote_error));
        }

        EXPECT_EQ (data::size (l.Broadcast), 1);
    }

    namespace {
        net::HTTP::response respond (int status, const std::string &body) {
            return net::HTTP::response (status, {{"content-type", "application/json"}}, bytes (data::string (body)));
        }

        void expect_remote_error (const net::HTTP::response &r, maybe<std::string> message = {}) {
            try {
                read_response (r);
                FAIL () << "response should have been rejected";
            } catch (const data::exception &x) {
                EXPECT_TRUE (is (x, problem::remote_error));
                if (bool (message)) EXPECT_EQ (std::string {x.what ()}, *message);
            }
        }
    }

    TEST (Network, Response) {
        EXPECT_EQ (read_response (respond (200, "{\"height\": 5}")), (JSON {{"height", 5}}));
        EXPECT_EQ (read_response (respond (200, "[]")), JSON::array ());
        EXPECT_EQ (read_response (respond (200, "")), JSON (nullptr));

        // the server's message is passed on as it is.
        expect_remote_error (respond (400, "invalid address"), std::string {"invalid address"});
        expect_remote_error (respond (500, ""), std::string {""});
        expect_remote_error (respond (200, "{\"height\":"));
    }

}
