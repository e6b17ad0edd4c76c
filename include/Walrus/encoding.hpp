#ifndef WALRUS_ENCODING
#define WALRUS_ENCODING

#include <Walrus/types.hpp>

namespace Walrus {

    // writes the canonical encoding that transaction ids and
    // signature hashes are computed over. Integers and lengths
    // are 8 bytes little endian; byte strings are length-prefixed.
    struct encoder {
        lazy_bytes_writer Writer {};

        encoder &operator << (uint64 u) {
            Writer << uint64_little {u};
            return *this;
        }

        encoder &operator << (const bytes &b) {
            Writer << uint64_little {static_cast<uint64> (b.size ())} << b;
            return *this;
        }

        // digests are written without a length.
        encoder &operator << (const digest256 &d) {
            Writer << d;
            return *this;
        }

        encoder &operator << (byte b) {
            Writer << b;
            return *this;
        }

        // the 16 byte name of a signature algorithm, padded with zeros.
        encoder &specifier (const std::string &name) {
            Writer << bytes (data::string {name});
            for (size_t i = name.size (); i < 16; i++) Writer << byte (0);
            return *this;
        }

        bytes complete () {
            return Writer.complete ();
        }
    };

}

#endif
