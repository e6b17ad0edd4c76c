#ifndef WALRUS_TYPES
#define WALRUS_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <data/encoding/hex.hpp>
#include <gigamonkey/types.hpp>
#include <gigamonkey/secp256k1.hpp>
#include <gigamonkey/hash.hpp>
#include <gigamonkey/schema/hd.hpp>
#include <filesystem>

namespace Walrus {
    using namespace data;
    namespace secp256k1 = Gigamonkey::secp256k1;
    namespace HD = Gigamonkey::HD;
    using digest256 = Gigamonkey::digest256;
    using filepath = std::filesystem::path;

    // the id of an output (the parent of an input) and
    // the id of a transaction are both 32 byte digests.
    using output_id = digest256;
    using TXID = digest256;

    std::string inline write (const digest256 &d) {
        return encoding::hex::write (d);
    }

    // read a digest written as 64 hex characters.
    maybe<digest256> read_digest (string_view);
}

#endif
