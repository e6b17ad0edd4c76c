#include <cstdlib>  // for std::getenv

#include "Walrus.hpp"

using namespace Walrus;

bool ask (const std::string &question) {
    return get_user_yes_or_no (question);
}

api_address read_api_address (const arg_parser &p) {
    maybe<std::string> api;
    p.get ("api", api);
    return api_address::read (bool (api) ? *api : std::string {options::DefaultAPIAddress});
}

ptr<device> open_device () {
    throw Walrus::exception (problem::signer_unavailable) <<
        "this build has no transport for a hardware signer; use --hot to sign with a seed";
}

namespace {
    seed read_seed () {
        const char *val = std::getenv (options::SeedEnvironmentVariable);
        if (bool (val) && std::string {val} != "") return seed::read (std::string {val});

        std::string words = get_user_password ("Seed: ");
        if (words == "") throw Walrus::exception (problem::signer_unavailable) << "no seed provided";
        return seed::read (words);
    }
}

signer &acquire_signer::operator () () {
    if (Signer) return *Signer;

    if (Args.has ("hot")) {
        seed s = read_seed ();
        Signer = std::static_pointer_cast<signer> (std::make_shared<seed_signer> (s, Ledger.consensus ().Height, &ask));
    } else Signer = std::static_pointer_cast<signer> (std::make_shared<device_signer> (open_device ()));

    return *Signer;
}

void print_transaction (const transaction &t) {
    std::cout << "Please verify the transaction details:" << std::endl;
    write_details (std::cout, t);
}

signed_transaction sign_owned (ledger &l, acquire_signer &acquire, const transaction &t) {
    owned keys = owned_keys (l, t);

    // don't ask for the signer if we have nothing to sign.
    if (data::size (keys) == 0) {
        std::cout << "Nothing to sign: none of the inputs belong to this wallet." << std::endl;
        return signed_transaction {t, {}};
    }

    signed_transaction signed_tx = Walrus::sign (t, keys, acquire ());
    if (signed_tx.nothing_to_sign ()) std::cout << "Nothing to sign: every input of this wallet is already signed." << std::endl;
    else std::cout << "Added " << data::size (signed_tx.Slots) << " signature" <<
        (data::size (signed_tx.Slots) == 1 ? "" : "s") << "." << std::endl;

    return signed_tx;
}
