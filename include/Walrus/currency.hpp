#ifndef WALRUS_CURRENCY
#define WALRUS_CURRENCY

#include <Walrus/types.hpp>
#include <Walrus/error.hpp>

namespace Walrus {

    // a non-negative amount of hastings, the smallest unit of currency.
    // One coin is 10^24 hastings.
    struct currency {
        N Value;

        currency () : Value {0} {}
        currency (uint64 h) : Value {h} {}
        explicit currency (const N &n) : Value {n} {}

        // 10^24 hastings.
        static const currency &coin ();

        // n whole coins.
        static currency coins (uint64 n);

        // read a decimal number of hastings, as the ledger writes it.
        static currency read (string_view);

        // read an amount in coins. The amount may be written
        // as a decimal (1.5) or as a ratio (3/2). Digits beyond
        // the precision of a hasting are truncated.
        static currency read_coins (string_view);

        // decimal number of hastings.
        std::string write () const;

        // the value with the largest unit that does not exceed it,
        // to four significant figures: 1.5 SC, 320 mS, 999 H.
        std::string units () const;

        // the value in coins, rounded to the given number of decimal places.
        std::string in_coins (uint32 decimals) const;

        bool zero () const {
            return Value == 0;
        }

        currency operator + (const currency &c) const {
            return currency {Value + c.Value};
        }

        // throws if the result would be negative.
        currency operator - (const currency &) const;

        currency operator * (uint64 n) const {
            return currency {Value * N {n}};
        }

        // multiply by num / den, rounding down.
        currency mul_ratio (uint64 num, uint64 den) const;

        currency &operator += (const currency &c) {
            Value = Value + c.Value;
            return *this;
        }

        currency &operator -= (const currency &c) {
            return *this = *this - c;
        }

        bool operator == (const currency &c) const {
            return Value == c.Value;
        }

        bool operator != (const currency &c) const {
            return !(Value == c.Value);
        }

        bool operator < (const currency &c) const {
            return Value < c.Value;
        }

        bool operator > (const currency &c) const {
            return c.Value < Value;
        }

        bool operator <= (const currency &c) const {
            return !(c.Value < Value);
        }

        bool operator >= (const currency &c) const {
            return !(Value < c.Value);
        }

        // big-endian with no leading zero bytes.
        bytes big_endian () const;

        explicit currency (const JSON &);
        explicit operator JSON () const;
    };

    currency inline max (const currency &a, const currency &b) {
        return a < b ? b : a;
    }

    std::ostream inline &operator << (std::ostream &o, const currency &c) {
        return o << c.units ();
    }

    inline currency::currency (const JSON &j) : currency {} {
        if (!j.is_string ()) throw exception (problem::invalid_input) << "expected currency as a decimal string";
        *this = read (std::string (j));
    }

    inline currency::operator JSON () const {
        return JSON (write ());
    }
}

#endif
