#include "Walrus.hpp"

using namespace Walrus;

namespace {

    // address:amount,address:amount with amounts in coins.
    list<output> read_outputs (const std::string &x) {
        list<output> outputs {};
        string_view rest {x};
        while (rest.size () != 0) {
            auto comma = rest.find (',');
            string_view pair = rest.substr (0, comma);
            rest = comma == string_view::npos ? string_view {} : rest.substr (comma + 1);

            auto colon = pair.find (':');
            if (colon == string_view::npos)
                throw Walrus::exception (problem::invalid_input) << "invalid output \"" << pair << "\": expected address:amount";

            unlock_hash to = unlock_hash::read (pair.substr (0, colon));
            currency amount = currency::read_coins (pair.substr (colon + 1));
            if (amount.zero ()) throw Walrus::exception (problem::invalid_input) << "invalid output \"" << pair << "\": amount is zero";

            outputs <<= output {amount, to};
        }

        if (data::size (outputs) == 0) throw Walrus::exception (problem::invalid_input) << "no outputs provided";
        return outputs;
    }

    // fee as a percentage of the amount sent, to two decimal places.
    std::string fee_percent (const currency &fee, const currency &sent) {
        if (sent.zero ()) return "0";
        currency hundredths = fee.mul_ratio (10000, 1);
        N p = hundredths.Value / sent.Value;
        std::string frac = encoding::decimal::write (p % N {100});
        return encoding::decimal::write (p / N {100}) + "." + (frac.size () < 2 ? "0" : "") + frac;
    }

    void print_summary (const spend::spent &s, uint32 recipients) {
        std::cout << "Transaction summary:" << std::endl;
        std::cout << "- " << data::size (s.Used) << " input" << (data::size (s.Used) == 1 ? "" : "s") <<
            ", totalling " << total_value (s.Used) << std::endl;
        std::cout << "- " << recipients << " recipient output" << (recipients == 1 ? "" : "s") <<
            ", totalling " << s.Payment << std::endl;
        if (s.DonationReduced)
            std::cout << "- Not enough funds for the full donation. What would have been change is donated instead." << std::endl;
        if (!s.Donation.zero ())
            std::cout << "- A donation of " << s.Donation << " to the narwal server" << std::endl;
        if (!s.Change.zero ())
            std::cout << "- A change output, sending " << s.Change << " back to your wallet at " << *s.ChangeAddress << std::endl;
        std::cout << "- A miner fee of " << s.fee () << ", which is " <<
            fee_percent (s.fee (), s.Payment + s.Donation) << "% of the total amount being sent" << std::endl;
    }

    struct finish_options {
        maybe<std::string> File;
        bool Sign;
        bool Broadcast;
    };

    // everything is checked before we talk to the server.
    finish_options read_finish_options (const arg_parser &p, uint32 file_index) {
        finish_options o {{}, p.has ("sign"), p.has ("broadcast")};
        p.get (file_index, "file", o.File);

        if (o.Broadcast && !o.Sign)
            throw Walrus::exception (problem::invalid_input) << "cannot broadcast an unsigned transaction; use --sign";

        if (!o.Broadcast && !bool (o.File))
            throw Walrus::exception (problem::invalid_input) << "please specify a file to write the transaction to";

        return o;
    }

    maybe<std::string> read_change_address (const arg_parser &p) {
        maybe<std::string> change;
        p.get ("change", change);

        // check it now so that a bad address is caught before anything else happens.
        if (bool (change)) unlock_hash::read (*change);
        return change;
    }

    void finish (const finish_options &o, ledger &l, acquire_signer &acquire, const spend::spent &s) {
        if (!o.Sign) {
            write_transaction (*o.File, s.Transaction);
            std::cout << "Wrote unsigned transaction to " << *o.File << "." << std::endl;
            return;
        }

        signed_transaction signed_tx = sign_owned (l, acquire, s.Transaction);

        if (o.Broadcast) {
            TXID id = broadcast (l, broadcastable (signed_tx));
            std::cout << "Transaction broadcast successfully.\nTransaction ID: " << Walrus::write (id) << std::endl;
            return;
        }

        write_transaction (*o.File, signed_tx.Transaction);
        std::cout << "Wrote " << (signed_tx.nothing_to_sign () ? "unsigned" : "signed") <<
            " transaction to " << *o.File << "." << std::endl;
    }
}

void command_txn (const arg_parser &p) {
    maybe<std::string> outputs_arg;
    p.get (2, "outputs", outputs_arg);
    if (!bool (outputs_arg)) throw Walrus::exception (problem::invalid_input) << "please specify the outputs as address:amount,...";

    list<output> to = read_outputs (*outputs_arg);
    finish_options o = read_finish_options (p, 3);
    maybe<std::string> change_address = read_change_address (p);
    api_address api = read_api_address (p);

    walrus_client client {api};
    acquire_signer acquire {p, client};

    spend make_txn {client, change_allocator {client, [&acquire] () -> signer & {
        return acquire ();
    }, &ask}, &standard_size, p.has ("confirmed")};

    spend::spent s = make_txn (to, donation_address (api), change_address);

    print_summary (s, data::size (to));
    finish (o, client, acquire, s);
}

void command_split (const arg_parser &p) {
    maybe<uint32> n;
    p.get (2, "outputs", n);
    if (!bool (n) || *n == 0) throw Walrus::exception (problem::invalid_input) << "please specify a positive number of outputs";

    maybe<std::string> amount_arg;
    p.get (3, "amount", amount_arg);
    if (!bool (amount_arg)) throw Walrus::exception (problem::invalid_input) << "please specify the amount of each output in SC";

    currency per_output = currency::read_coins (*amount_arg);
    if (per_output.zero ()) throw Walrus::exception (problem::invalid_input) << "amount per output must be positive";

    finish_options o = read_finish_options (p, 4);
    maybe<std::string> change_address = read_change_address (p);

    walrus_client client {read_api_address (p)};
    acquire_signer acquire {p, client};

    spend make_txn {client, change_allocator {client, [&acquire] () -> signer & {
        return acquire ();
    }, &ask}, &standard_size, p.has ("confirmed")};

    spend::spent s = make_txn.split (*n, per_output, change_address);

    std::cout << "Splitting into " << *n << " outputs of " << per_output << " each, sent to " << *s.ChangeAddress << "." << std::endl;
    print_summary (s, *n);
    finish (o, client, acquire, s);
}
