#include <Walrus/files.hpp>
#include <Walrus/error.hpp>
#include <fstream>

namespace Walrus {

    void write_to_file (const std::string &x, const filepath &p) {
        filepath temp {p};
        temp += ".tmp";

        std::fstream file;
        file.open (temp, std::ios::out | std::ios::trunc);
        if (!file) throw exception (problem::invalid_input) << "could not open file " << temp.string ();
        file << x;
        file.close ();
        if (!file) throw exception (problem::unknown) << "could not write file " << temp.string ();

        std::error_code err;
        std::filesystem::rename (temp, p, err);
        if (err) {
            std::filesystem::remove (temp, err);
            throw exception (problem::unknown) << "could not write file " << p.string ();
        }
    }

    JSON read_from_file (const filepath &p) {
        if (!std::filesystem::exists (p)) throw exception (problem::invalid_input) << "file " << p.string () << " does not exist";

        std::ifstream file;
        file.open (p, std::ios::in);
        if (!file) throw exception (problem::invalid_input) << "could not open file " << p.string ();

        try {
            return JSON::parse (file);
        } catch (const JSON::exception &x) {
            throw exception (problem::invalid_input) << "could not read " << p.string () << ": " << x.what ();
        }
    }

    filepath signed_filepath (const filepath &p) {
        filepath signed_path {p};
        signed_path.replace_filename (p.stem ().string () + "-signed" + p.extension ().string ());
        return signed_path;
    }

}
