#ifndef WALRUS_OPTIONS
#define WALRUS_OPTIONS

#include <Walrus/types.hpp>

namespace Walrus {

    // TODO we want to load these options from a file at some point.
    struct options {
        // where the walrus server listens by default.
        constexpr static const char *DefaultAPIAddress {"localhost:9380"};

        // the environment variable that holds the seed for hot signing.
        constexpr static const char *SeedEnvironmentVariable {"WALRUS_SEED"};

        // the donation is DonationRate[0] / DonationRate[1] of the payment,
        // but never less than MinDonationCoins.
        constexpr static uint64 DonationRate[2] {1, 100};
        constexpr static uint64 MinDonationCoins {10};

        // number of decimal digits in one coin.
        constexpr static uint32 CoinDecimals {24};

        // signatures at or above this height use replay protection version 1.
        constexpr static uint64 HardforkHeight {179000};

        // key indices must be valid non-hardened BIP 32 indices.
        constexpr static uint64 MaxKeyIndex {0x7fffffff};

        // how many transactions we ask for at once when looking at history.
        constexpr static uint32 DefaultMaxHistory {100};
    };
}

#endif
