#include <Walrus/network.hpp>

namespace Walrus {

    TXID broadcast (ledger &l, const transaction &t) {
        l.broadcast ({t});
        return t.id ();
    }

    api_address api_address::read (string_view x) {
        api_address a {"http", "", ""};

        string_view rest = x;
        if (auto scheme_end = rest.find ("://"); scheme_end != string_view::npos) {
            a.Scheme = std::string {rest.substr (0, scheme_end)};
            rest = rest.substr (scheme_end + 3);
        }

        if (a.Scheme != "http" && a.Scheme != "https")
            throw exception (problem::invalid_input) << "unsupported scheme in API address \"" << x << "\"";

        auto path_begin = rest.find ('/');
        a.Authority = std::string {rest.substr (0, path_begin)};
        if (path_begin != string_view::npos) a.Path = std::string {rest.substr (path_begin)};

        // routes begin with '/' so the prefix must not end with one.
        while (a.Path.size () > 0 && a.Path.back () == '/') a.Path.pop_back ();

        if (a.Authority.size () == 0) throw exception (problem::invalid_input) << "invalid API address \"" << x << "\"";

        return a;
    }

    std::string api_address::write () const {
        return Scheme + "://" + Authority + Path;
    }

    maybe<api_address> donation_endpoint (const api_address &a) {
        // the path is .../wallet/<id>
        auto id_begin = a.Path.rfind ('/');
        if (id_begin == std::string::npos || id_begin + 1 == a.Path.size ()) return {};

        std::string prefix = a.Path.substr (0, id_begin);
        auto wallet_begin = prefix.rfind ('/');
        if (wallet_begin == std::string::npos || prefix.substr (wallet_begin + 1) != "wallet") return {};

        return api_address {a.Scheme, a.Authority, prefix.substr (0, wallet_begin) + "/donations"};
    }

    maybe<unlock_hash> donation_address (const api_address &a) {
        maybe<api_address> endpoint = donation_endpoint (a);
        if (!bool (endpoint)) return {};

        try {
            walrus_client client {*endpoint};
            JSON j = client.call (client.get (""));
            if (!j.is_string () || !unlock_hash::valid (std::string (j))) return {};
            return unlock_hash::read (std::string (j));
        } catch (const std::exception &x) {
            std::cout << "Warning! Could not get a donation address from " << endpoint->write () << ": " << x.what () << std::endl;
            return {};
        }
    }

    namespace {
        ptr<net::HTTP::SSL> make_SSL (const api_address &a) {
            if (a.Scheme != "https") return nullptr;
            auto ssl = std::make_shared<net::HTTP::SSL> (net::HTTP::SSL::tlsv12_client);
            ssl->set_default_verify_paths ();
            ssl->set_verify_mode (net::asio::ssl::verify_peer);
            return ssl;
        }

        UTF8 write_bool (bool b) {
            return b ? "true" : "false";
        }
    }

    walrus_client::walrus_client (const api_address &a) :
        net::HTTP::client_blocking {make_SSL (a), net::HTTP::REST {a.Scheme, a.Authority}, tools::rate_limiter {20, 1}}, API {a} {}

    net::HTTP::request walrus_client::get (const std::string &route, list<entry<UTF8, UTF8>> query) const {
        return this->REST.GET (API.Path + route, query);
    }

    net::HTTP::request walrus_client::post (const std::string &route, const JSON &body) const {
        return net::HTTP::request (this->REST (net::HTTP::request::make {}.method (net::HTTP::method::post).
            path (API.Path + route).body (body)));
    }

    JSON read_response (const net::HTTP::response &response) {
        if (response.Status != net::HTTP::status::ok) throw exception (problem::remote_error) << response.Body;

        if (response.Body == "") return JSON (nullptr);

        try {
            return JSON::parse (response.Body);
        } catch (const JSON::exception &x) {
            throw exception (problem::remote_error) << "could not read response: " << x.what ();
        }
    }

    JSON walrus_client::call (const net::HTTP::request &request) {
        net::HTTP::response response = [&] () -> net::HTTP::response {
            try {
                return (*this) (request);
            } catch (const net::HTTP::exception &x) {
                throw exception (problem::remote_error) << x.what ();
            } catch (const std::exception &x) {
                throw exception (problem::remote_error) << "could not connect to " << API.write () << ": " << x.what ();
            }
        } ();

        return read_response (response);
    }

    currency walrus_client::balance (bool confirmed_only) {
        return currency {call (get ("/balance", {entry<UTF8, UTF8> {"confirmed", write_bool (confirmed_only)}}))};
    }

    list<unlock_hash> walrus_client::addresses () {
        JSON j = call (get ("/addresses"));
        if (!j.is_array ()) throw exception (problem::remote_error) << "expected a list of addresses; got " << j.dump ();

        list<unlock_hash> addrs;
        for (const JSON &a : j) addrs <<= unlock_hash {a};
        return addrs;
    }

    seed_address_info walrus_client::address_info (const unlock_hash &a) {
        return seed_address_info {call (get ("/addresses/" + a.write ()))};
    }

    void walrus_client::watch_address (const seed_address_info &info) {
        call (post ("/addresses", JSON (info)));
    }

    list<utxo> walrus_client::unspent_outputs (bool confirmed_only) {
        JSON j = call (get ("/utxos", {entry<UTF8, UTF8> {"confirmed", write_bool (confirmed_only)}}));
        if (!j.is_array ()) throw exception (problem::remote_error) << "expected a list of outputs; got " << j.dump ();

        list<utxo> utxos;
        for (const JSON &u : j) utxos <<= utxo {u};
        return utxos;
    }

    currency walrus_client::recommended_fee () {
        return currency {call (get ("/fee"))};
    }

    consensus_state walrus_client::consensus () {
        JSON j = call (get ("/consensus"));
        if (!j.is_object () || !j.contains ("height") || !j["height"].is_number_unsigned ())
            throw exception (problem::remote_error) << "invalid consensus " << j.dump ();

        consensus_state c {uint64 (j["height"]), digest256 {}};
        if (j.contains ("ID") && j["ID"].is_string ())
            if (maybe<digest256> id = read_digest (std::string (j["ID"])); bool (id)) c.BlockID = *id;

        return c;
    }

    list<TXID> walrus_client::transactions (const unlock_hash &a, uint32 max) {
        JSON j = call (get ("/addresses/" + a.write () + "/transactions", {entry<UTF8, UTF8> {"max", std::to_string (max)}}));
        if (!j.is_array ()) throw exception (problem::remote_error) << "expected a list of transaction ids; got " << j.dump ();

        list<TXID> txids;
        for (const JSON &id : j) {
            maybe<digest256> d = id.is_string () ? read_digest (std::string (id)) : maybe<digest256> {};
            if (!bool (d)) throw exception (problem::remote_error) << "invalid transaction id " << id.dump ();
            txids <<= *d;
        }

        return txids;
    }

    void walrus_client::broadcast (list<transaction> txs) {
        JSON::array_t j;
        for (const transaction &t : txs) j.push_back (JSON (t));
        call (post ("/broadcast", j));
    }

    seed_address_info::seed_address_info (const JSON &j) : UnlockConditions {}, KeyIndex {0} {
        if (!j.is_object () || !j.contains ("unlockConditions") || !j.contains ("keyIndex") || !j["keyIndex"].is_number_unsigned ())
            throw exception (problem::remote_error) << "invalid address info " << j.dump ();

        UnlockConditions = unlock_conditions {j["unlockConditions"]};
        KeyIndex = uint64 (j["keyIndex"]);
    }

    seed_address_info::operator JSON () const {
        return JSON {
            {"unlockConditions", JSON (UnlockConditions)},
            {"keyIndex", KeyIndex}};
    }

    utxo::utxo (const JSON &j) : ID {}, Value {}, UnlockConditions {}, UnlockHash {}, KeyIndex {0} {
        if (!j.is_object () || !j.contains ("ID") || !j.contains ("value") ||
            !j.contains ("unlockConditions") || !j.contains ("keyIndex"))
            throw exception (problem::remote_error) << "invalid utxo " << j.dump ();

        maybe<digest256> id = j["ID"].is_string () ? read_digest (std::string (j["ID"])) : maybe<digest256> {};
        if (!bool (id)) throw exception (problem::remote_error) << "invalid utxo id " << j["ID"].dump ();

        ID = *id;
        Value = currency {j["value"]};
        UnlockConditions = unlock_conditions {j["unlockConditions"]};
        UnlockHash = j.contains ("unlockHash") ? unlock_hash {j["unlockHash"]} : UnlockConditions.address ();
        KeyIndex = uint64 (j["keyIndex"]);
    }

    utxo::operator JSON () const {
        return JSON {
            {"ID", Walrus::write (ID)},
            {"value", JSON (Value)},
            {"unlockConditions", JSON (UnlockConditions)},
            {"unlockHash", JSON (UnlockHash)},
            {"keyIndex", KeyIndex}};
    }

}
