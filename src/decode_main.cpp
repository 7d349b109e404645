#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "io/errors.hpp"
#include "io/file_io.hpp"

#include <iostream>

int main(int argc, char** argv) {
    try {
        hufz::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cerr << "Usage: hufz_decode --in <input.hufz> --out <output>\n";
            return 1;
        }

        hufz::CodecStats stats = hufz::decode_file(in, out);
        std::cout << "Number of bytes in input: " << hufz::count_bytes_in_file(in) << "\n";
        std::cout << "Number of bytes in output: " << stats.output_bytes << "\n";
        std::cout << "Wrote: " << out << "\n";
        return 0;
    } catch (const hufz::IoError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    } catch (const hufz::FormatError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 4;
    }
}
