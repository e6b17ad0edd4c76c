#include "Walrus.hpp"

using namespace Walrus;

namespace {
    filepath read_file_arg (const arg_parser &p) {
        maybe<std::string> file;
        p.get (2, "file", file);
        if (!bool (file)) throw Walrus::exception (problem::invalid_input) << "please specify a transaction file";
        return filepath {*file};
    }
}

void command_sign (const arg_parser &p) {
    filepath file = read_file_arg (p);
    transaction t = read_transaction (file);

    print_transaction (t);

    walrus_client client {read_api_address (p)};
    acquire_signer acquire {p, client};

    signed_transaction signed_tx = sign_owned (client, acquire, t);
    if (signed_tx.nothing_to_sign ()) return;

    if (p.has ("broadcast")) {
        TXID id = broadcast (client, signed_tx.Transaction);
        std::cout << "Transaction broadcast successfully.\nTransaction ID: " << Walrus::write (id) << std::endl;
        return;
    }

    filepath out = signed_filepath (file);
    write_transaction (out, signed_tx.Transaction);
    std::cout << "Wrote signed transaction to " << out.string () << "." << std::endl;
}

void command_broadcast (const arg_parser &p) {
    transaction t = read_transaction (read_file_arg (p));

    if (data::size (t.Signatures) == 0)
        throw Walrus::exception (problem::invalid_input) << "transaction has no signatures";

    walrus_client client {read_api_address (p)};
    TXID id = broadcast (client, t);
    std::cout << "Transaction broadcast successfully.\nTransaction ID: " << Walrus::write (id) << std::endl;
}
