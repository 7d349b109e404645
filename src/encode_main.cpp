#include "cli/cli_parser.hpp"
#include "codec/encoder.hpp"
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
            std::cout << "Usage: hufz_encode --in <input> --out <output.hufz>\n";
            return 1;
        }
        std::cout << "Encoding " << in << " -> " << out << "\n";
        std::cout << "Number of bytes in input: " << hufz::count_bytes_in_file(in) << "\n";
        hufz::CodecStats stats = hufz::encode_file(in, out);
        std::cout << "Number of bits in payload: " << stats.payload_bits << "\n";
        std::cout << "Wrote: " << out << " (" << hufz::count_bytes_in_file(out) << " bytes)\n";
        return 0;
    } catch (const hufz::IoError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 4;
    }
}
