#ifndef WALRUS_NETWORK
#define WALRUS_NETWORK

#include <data/net/HTTP_client.hpp>
#include <Walrus/transaction.hpp>
#include <Walrus/options.hpp>

namespace Walrus {

    // an address that the ledger watches, together with
    // the index of the key that it was derived from.
    struct seed_address_info {
        unlock_conditions UnlockConditions;
        uint64 KeyIndex;

        unlock_hash address () const {
            return UnlockConditions.address ();
        }

        explicit seed_address_info (const JSON &);
        seed_address_info (const unlock_conditions &u, uint64 k) : UnlockConditions {u}, KeyIndex {k} {}
        explicit operator JSON () const;
    };

    struct utxo {
        output_id ID;
        currency Value;
        unlock_conditions UnlockConditions;
        unlock_hash UnlockHash;
        uint64 KeyIndex;

        explicit utxo (const JSON &);
        utxo (const output_id &id, const currency &v, const unlock_conditions &u, uint64 k) :
            ID {id}, Value {v}, UnlockConditions {u}, UnlockHash {u.address ()}, KeyIndex {k} {}
        explicit operator JSON () const;
    };

    struct consensus_state {
        uint64 Height;
        digest256 BlockID;
    };

    // a service that watches the ledger for a set of addresses.
    struct ledger {
        // total value of unspent outputs.
        virtual currency balance (bool confirmed_only) = 0;

        // all watched addresses.
        virtual list<unlock_hash> addresses () = 0;

        // throws remote_error if the address is not watched.
        virtual seed_address_info address_info (const unlock_hash &) = 0;

        // start watching an address.
        virtual void watch_address (const seed_address_info &) = 0;

        virtual list<utxo> unspent_outputs (bool confirmed_only) = 0;

        // per byte.
        virtual currency recommended_fee () = 0;

        virtual consensus_state consensus () = 0;

        // ids of transactions relevant to the given address, most recent first.
        virtual list<TXID> transactions (const unlock_hash &, uint32 max) = 0;

        virtual void broadcast (list<transaction>) = 0;

        virtual ~ledger () {}
    };

    // broadcast a single transaction and return its id.
    TXID broadcast (ledger &, const transaction &);

    // where the walrus server is. May be given as host:port or as a URL with a path,
    // in which case every route is appended to the path.
    struct api_address {
        std::string Scheme;
        std::string Authority;
        std::string Path;

        // throws invalid_input
        static api_address read (string_view);

        std::string write () const;
    };

    // A response other than 200 OK is a remote_error carrying the body.
    // An empty body is null and anything else must be JSON.
    JSON read_response (const net::HTTP::response &);

    struct walrus_client : ledger, net::HTTP::client_blocking {
        api_address API;

        walrus_client (const api_address &);

        currency balance (bool confirmed_only) final override;
        list<unlock_hash> addresses () final override;
        seed_address_info address_info (const unlock_hash &) final override;
        void watch_address (const seed_address_info &) final override;
        list<utxo> unspent_outputs (bool confirmed_only) final override;
        currency recommended_fee () final override;
        consensus_state consensus () final override;
        list<TXID> transactions (const unlock_hash &, uint32 max) final override;
        void broadcast (list<transaction>) final override;

        // make a request and read the response. Failure to connect is a remote_error.
        JSON call (const net::HTTP::request &);

        net::HTTP::request get (const std::string &route, list<entry<UTF8, UTF8>> query = {}) const;
        net::HTTP::request post (const std::string &route, const JSON &body) const;
    };

    // Narwal servers serve a wallet at .../wallet/<id> and provide an address
    // for donations at .../donations. If the API address is not of this form or
    // the donation address cannot be retrieved, there is no donation.
    maybe<unlock_hash> donation_address (const api_address &);

    // the address from which the donation address would be retrieved.
    maybe<api_address> donation_endpoint (const api_address &);
}

#endif
