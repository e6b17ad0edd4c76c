#include <Walrus/currency.hpp>
#include <Walrus/options.hpp>

namespace Walrus {

    namespace {
        bool all_digits (string_view x) {
            if (x.size () == 0) return false;
            for (char c : x) if (c < '0' || c > '9') return false;
            return true;
        }

        N power_of_ten (uint32 exp) {
            N n {1};
            for (uint32 i = 0; i < exp; i++) n = n * N {10};
            return n;
        }

        struct unit {
            uint32 Exponent;
            const char *Name;
        };

        // largest first.
        constexpr unit Units[] {
            {36, "TS"}, {33, "GS"}, {30, "MS"}, {27, "KS"}, {24, "SC"}, {21, "mS"},
            {18, "uS"}, {15, "nS"}, {12, "pS"}, {9, "fS"}, {6, "aS"}};
    }

    const currency &currency::coin () {
        static currency c {power_of_ten (options::CoinDecimals)};
        return c;
    }

    currency currency::coins (uint64 n) {
        return coin () * n;
    }

    currency currency::read (string_view x) {
        if (!all_digits (x)) throw exception (problem::invalid_input) << "invalid currency value \"" << x << "\"";
        return currency {N {std::string {x}}};
    }

    currency currency::read_coins (string_view x) {
        if (auto slash = x.find ('/'); slash != string_view::npos) {
            string_view num = x.substr (0, slash);
            string_view den = x.substr (slash + 1);
            if (!all_digits (num) || !all_digits (den))
                throw exception (problem::invalid_input) << "invalid amount \"" << x << "\"";

            N d {std::string {den}};
            if (d == 0) throw exception (problem::invalid_input) << "invalid amount \"" << x << "\": zero denominator";
            return currency {N {std::string {num}} * coin ().Value / d};
        }

        string_view whole = x;
        string_view fraction {};
        if (auto point = x.find ('.'); point != string_view::npos) {
            whole = x.substr (0, point);
            fraction = x.substr (point + 1);
        }

        if ((whole.size () == 0 && fraction.size () == 0) ||
            (whole.size () != 0 && !all_digits (whole)) ||
            (fraction.size () != 0 && !all_digits (fraction)))
            throw exception (problem::invalid_input) << "invalid amount \"" << x << "\"";

        N value {0};
        if (whole.size () != 0) value = N {std::string {whole}} * coin ().Value;

        if (fraction.size () != 0) {
            std::string digits {fraction.substr (0, options::CoinDecimals)};
            digits.resize (options::CoinDecimals, '0');
            value = value + N {digits};
        }

        return currency {value};
    }

    std::string currency::write () const {
        return encoding::decimal::write (Value);
    }

    currency currency::operator - (const currency &c) const {
        if (Value < c.Value) throw exception (problem::unknown) << "currency subtraction " << write () << " - " << c.write () << " is negative";
        return currency {Value - c.Value};
    }

    currency currency::mul_ratio (uint64 num, uint64 den) const {
        if (den == 0) throw exception (problem::unknown) << "division by zero";
        return currency {Value * N {num} / N {den}};
    }

    std::string currency::units () const {
        std::string digits = write ();

        // below one aS we just count hastings.
        if (digits.size () <= 6) return digits + " H";

        uint32 total = digits.size ();
        const unit *u = &Units[std::size (Units) - 1];
        for (const unit &x : Units) if (x.Exponent < total) {
            u = &x;
            break;
        }

        // number of digits before the decimal point.
        uint32 whole = total - u->Exponent;

        // round to four significant figures.
        std::string sig = digits.substr (0, 4);
        if (digits[4] >= '5') {
            int i = 3;
            while (i >= 0 && sig[i] == '9') sig[i--] = '0';
            if (i < 0) {
                sig = "1000";
                whole++;
            } else sig[i]++;
        }

        std::stringstream ss;
        if (whole > 4) {
            std::string mantissa = sig.substr (0, 1) + "." + sig.substr (1);
            while (mantissa.back () == '0') mantissa.pop_back ();
            if (mantissa.back () == '.') mantissa.pop_back ();
            ss << mantissa << "e+" << (whole - 1 < 10 ? "0" : "") << (whole - 1);
        } else {
            std::string number = sig.substr (0, whole) + "." + sig.substr (whole);
            while (number.back () == '0') number.pop_back ();
            if (number.back () == '.') number.pop_back ();
            ss << number;
        }

        ss << " " << u->Name;
        return ss.str ();
    }

    std::string currency::in_coins (uint32 decimals) const {
        N scale = power_of_ten (decimals);
        N precision = coin ().Value;

        // round half up.
        N rounded = (Value * scale * N {2} + precision) / (precision * N {2});

        std::string whole = encoding::decimal::write (rounded / scale);
        if (decimals == 0) return whole;

        std::string fraction = encoding::decimal::write (rounded % scale);
        return whole + "." + std::string (decimals - fraction.size (), '0') + fraction;
    }

    bytes currency::big_endian () const {
        if (zero ()) return {};
        return bytes (N_bytes_big (Value).trim ());
    }

}
