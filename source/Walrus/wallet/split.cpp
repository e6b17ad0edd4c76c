#include <Walrus/wallet/split.hpp>

namespace Walrus {

    selected split (
        uint32 n,
        const currency &per_output,
        const currency &fee_per_byte,
        list<valued_input> available,
        tx_size size) {

        if (n == 0) throw exception (problem::invalid_input) << "cannot split into zero outputs";
        if (per_output.zero ()) throw exception (problem::invalid_input) << "cannot split into outputs of zero value";

        return select (per_output * n, fee_per_byte, available, n, size);
    }

    list<output> split_outputs (uint32 n, const currency &per_output, const currency &change, const unlock_hash &destination) {
        list<output> outputs {};
        for (uint32 i = 0; i < n; i++) outputs <<= output {per_output, destination};
        if (!change.zero ()) outputs <<= output {change, destination};
        return outputs;
    }

}
