#ifndef WALRUS_WALLET_SPLIT
#define WALRUS_WALLET_SPLIT

#include <Walrus/wallet/select.hpp>

namespace Walrus {

    // select inputs to fund n outputs of equal value. There is one more
    // output for change if anything is left over after the fee.
    selected split (
        uint32 n,
        const currency &per_output,
        const currency &fee_per_byte,
        list<valued_input> available,
        tx_size size = &standard_size);

    // n outputs of the given value to the destination, followed by the
    // change output to the same destination if there is any change.
    list<output> split_outputs (uint32 n, const currency &per_output, const currency &change, const unlock_hash &destination);
}

#endif
