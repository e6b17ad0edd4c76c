#include <data/io/exception.hpp>
#include <data/net/HTTP.hpp>

#include "Walrus.hpp"

Walrus::error run (const arg_parser &);

int main (int arg_count, char **arg_values) {

    auto err = run (arg_parser {arg_count, arg_values});

    if (err.Code == static_cast<int> (Walrus::problem::user_cancelled)) std::cout << "Aborted." << std::endl;
    else if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

Walrus::error run (const arg_parser &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::SEED: {
                    command_seed (p);
                    break;
                }

                case method::BALANCE: {
                    command_balance (p);
                    break;
                }

                case method::ADDRESSES: {
                    command_addresses (p);
                    break;
                }

                case method::ADDR: {
                    command_addr (p);
                    break;
                }

                case method::TXN: {
                    command_txn (p);
                    break;
                }

                case method::SIGN: {
                    command_sign (p);
                    break;
                }

                case method::BROADCAST: {
                    command_broadcast (p);
                    break;
                }

                case method::SPLIT: {
                    command_split (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                    return Walrus::error {static_cast<int> (Walrus::problem::invalid_input)};
                }
            }
        }

    } catch (const net::HTTP::exception &x) {
        std::cout << "Problem with http: " << std::endl;
        std::cout << "\trequest: " << x.Request << std::endl;
        std::cout << "\tresponse: " << x.Response << std::endl;
        return Walrus::error {static_cast<int> (Walrus::problem::remote_error), std::string {x.what ()}};
    } catch (const data::exception &x) {
        return Walrus::error {x.Code, std::string {x.what ()}};
    } catch (const std::exception &x) {
        return Walrus::error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    m = data::to_lower (*m);

    if (*m == "help") return method::HELP;
    if (*m == "version") return method::VERSION;
    if (*m == "seed") return method::SEED;
    if (*m == "balance") return method::BALANCE;
    if (*m == "addresses") return method::ADDRESSES;
    if (*m == "addr") return method::ADDR;
    if (*m == "txn") return method::TXN;
    if (*m == "sign") return method::SIGN;
    if (*m == "broadcast") return method::BROADCAST;
    if (*m == "split") return method::SPLIT;

    return method::UNSET;
}

void version () {
    std::cout << "Walrus wallet client version 0.1.0" << std::endl;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be [--api=<host:port>] [--hot] <method> <args>... where method is "
                "\n\tseed       -- generate a new seed phrase."
                "\n\tbalance    -- print the value in the wallet."
                "\n\taddresses  -- list the addresses that the walrus server is watching."
                "\n\taddr       -- generate a new address and watch it."
                "\n\ttxn        -- create a transaction."
                "\n\tsign       -- sign a transaction."
                "\n\tbroadcast  -- broadcast a signed transaction."
                "\n\tsplit      -- split the wallet into outputs of equal value."
                "\nuse help \"method\" for information on a specific method"
                "\n\nglobal options:"
                "\n\t(--api=<host:port | URL>) (= " << Walrus::options::DefaultAPIAddress << ") address of the walrus server"
                "\n\t(--hot) sign with a seed instead of a hardware signer. The seed is read from "
                << Walrus::options::SeedEnvironmentVariable << " if it is set." << std::endl;
        } break;
        case method::SEED : {
            std::cout << "Generate a new 24 word seed phrase (BIP 39). No parameters." << std::endl;
        } break;
        case method::BALANCE : {
            std::cout << "Print the value in the wallet."
                "\narguments for method balance:"
                "\n\t(--confirmed) (count only confirmed outputs)" << std::endl;
        } break;
        case method::ADDRESSES : {
            std::cout << "List the addresses that the walrus server is watching. No parameters." << std::endl;
        } break;
        case method::ADDR : {
            std::cout << "Generate a new address, confirm it, and tell the walrus server to watch it."
                "\narguments for method addr:"
                "\n\t(--index=)<key index> (= one more than the largest index in use)" << std::endl;
        } break;
        case method::TXN : {
            std::cout << "Create a transaction. Outputs are given as address:amount pairs separated by commas, "
                "with amounts in SC (1.5 or 3/2). If the server takes donations, a donation is added."
                "\narguments for method txn:"
                "\n\t(--outputs=)<address:amount,...>"
                "\n\t(--file=)<file to write the transaction to> (required unless --broadcast is given)"
                "\n\t(--sign) (sign the transaction)"
                "\n\t(--broadcast) (broadcast the transaction; requires --sign)"
                "\n\t(--change=<address>) (send change here instead of to a new address)"
                "\n\t(--confirmed) (spend only confirmed outputs)" << std::endl;
        } break;
        case method::SIGN : {
            std::cout << "Sign the inputs of a transaction that belong to this wallet. The signed "
                "transaction is written next to the original with -signed added to its name."
                "\narguments for method sign:"
                "\n\t(--file=)<transaction file>"
                "\n\t(--broadcast) (broadcast instead of writing a file)" << std::endl;
        } break;
        case method::BROADCAST : {
            std::cout << "Broadcast a signed transaction."
                "\narguments for method broadcast:"
                "\n\t(--file=)<transaction file>" << std::endl;
        } break;
        case method::SPLIT : {
            std::cout << "Split the wallet into outputs of equal value, all to one new address."
                "\narguments for method split:"
                "\n\t(--outputs=)<number of outputs>"
                "\n\t(--amount=)<SC per output>"
                "\n\t(--file=)<file to write the transaction to> (required unless --broadcast is given)"
                "\n\t(--sign) (sign the transaction)"
                "\n\t(--broadcast) (broadcast the transaction; requires --sign)"
                "\n\t(--change=<address>) (use this address instead of a new one)"
                "\n\t(--confirmed) (spend only confirmed outputs)" << std::endl;
        }
    }

}
