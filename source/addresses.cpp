#include <Walrus/random.hpp>

#include "Walrus.hpp"

using namespace Walrus;

void command_seed (const arg_parser &) {
    secure_random random {std::cout, std::cin};
    std::string words = seed::generate (random);
    std::cout << "Seed:\n\t" << words << "\nWrite it down and keep it secret." << std::endl;
}

void command_balance (const arg_parser &p) {
    walrus_client client {read_api_address (p)};
    std::cout << "Balance: " << client.balance (p.has ("confirmed")) << std::endl;
}

void command_addresses (const arg_parser &p) {
    walrus_client client {read_api_address (p)};
    list<unlock_hash> addrs = client.addresses ();
    if (data::size (addrs) == 0) {
        std::cout << "No addresses." << std::endl;
        return;
    }

    for (const unlock_hash &a : addrs) std::cout << a << std::endl;
}

void command_addr (const arg_parser &p) {
    maybe<uint64> index;
    p.get (2, "index", index);
    if (bool (index) && *index > options::MaxKeyIndex)
        throw Walrus::exception (problem::invalid_input) << "key index " << *index << " is too big";

    walrus_client client {read_api_address (p)};

    if (!bool (index)) index = next_unused_index (client);
    else for (const unlock_hash &a : client.addresses ())
        if (client.address_info (a).KeyIndex == *index) {
            std::cout << "WARNING: you have already generated an address with index " << *index << "." << std::endl;
            break;
        }

    acquire_signer acquire {p, client};
    seed_address_info info = generate_address (client, acquire (), *index, &ask);
    std::cout << "Now watching " << info.address () << " (key index " << info.KeyIndex << ")." << std::endl;
}
