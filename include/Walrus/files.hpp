#ifndef WALRUS_FILES
#define WALRUS_FILES

#include <Walrus/transaction.hpp>

namespace Walrus {

    // write a string to a file. The string goes to a temporary file first
    // which is renamed once it is complete, so the file is never left half written.
    void write_to_file (const std::string &, const filepath &);

    void inline write_to_file (const JSON &j, const filepath &p) {
        write_to_file (j.dump (2, ' ') + "\n", p);
    }

    // throws if the file does not exist or is not JSON.
    JSON read_from_file (const filepath &);

    // transactions are saved as indented JSON.
    void inline write_transaction (const filepath &p, const transaction &t) {
        write_to_file (JSON (t), p);
    }

    transaction inline read_transaction (const filepath &p) {
        return transaction {read_from_file (p)};
    }

    // where the signed version of a transaction goes: txn.json => txn-signed.json
    filepath signed_filepath (const filepath &);
}

#endif
