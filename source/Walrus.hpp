#ifndef WALRUS
#define WALRUS

#include <data/io/arg_parser.hpp>
#include <data/io/wait_for_enter.hpp>
#include <Walrus/wallet/spend.hpp>
#include <Walrus/wallet/sign.hpp>
#include <Walrus/files.hpp>

using namespace data;

using arg_parser = io::arg_parser;
using filepath = Walrus::filepath;

enum class method {
    UNSET,
    HELP,       // print help messages
    VERSION,    // print a version message
    SEED,       // generate a new seed phrase
    BALANCE,    // the value in the wallet
    ADDRESSES,  // list watched addresses
    ADDR,       // generate a new address and watch it
    TXN,        // create a transaction
    SIGN,       // sign a transaction from a file
    BROADCAST,  // broadcast a signed transaction from a file
    SPLIT       // split the wallet into outputs of equal value
};

method read_method (const arg_parser &, uint32 index = 1);

void version ();

void help (method meth = method::UNSET);

void command_seed (const arg_parser &);         // offline
void command_balance (const arg_parser &);
void command_addresses (const arg_parser &);
void command_addr (const arg_parser &);
void command_txn (const arg_parser &);
void command_sign (const arg_parser &);
void command_broadcast (const arg_parser &);
void command_split (const arg_parser &);

Walrus::api_address read_api_address (const arg_parser &);

// ask the user a yes or no question on the command line.
bool ask (const std::string &question);

// the signer is acquired the first time it is needed
// and released when the command is finished.
struct acquire_signer {
    const arg_parser &Args;
    Walrus::ledger &Ledger;

    Walrus::signer &operator () ();

    acquire_signer (const arg_parser &p, Walrus::ledger &l) : Args {p}, Ledger {l}, Signer {nullptr} {}

private:
    ptr<Walrus::signer> Signer;
};

// there is no transport for hardware signers in this program,
// so this always throws signer_unavailable.
ptr<Walrus::device> open_device ();

// print inputs, outputs and fee in coins.
void print_transaction (const Walrus::transaction &);

// sign a transaction with the keys that the ledger says are ours.
Walrus::signed_transaction sign_owned (Walrus::ledger &, acquire_signer &, const Walrus::transaction &);

#endif
