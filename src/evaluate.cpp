// Evaluator: encode -> decode -> byte equality and rate metrics per file.
#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "entropy/frequency_table.hpp"
#include "io/file_io.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Cli {
    std::vector<std::string> refs;
    std::string tmp_dir;
    std::string out_csv;
};

const char* kUsage = "Usage: hufz_evaluate --ref <file> [--ref <file> ...] --tmp_dir <dir> --out <metrics.csv>";

Cli parse_cli(int argc, char** argv) {
    hufz::CliParser p;
    p.parse(argc, argv);
    Cli c;
    c.refs = p.get_all("ref");
    c.tmp_dir = p.get("tmp_dir");
    c.out_csv = p.get("out");
    if (c.refs.empty() || c.tmp_dir.empty() || c.out_csv.empty()) {
        throw std::runtime_error(kUsage);
    }
    return c;
}

} // namespace

int main(int argc, char** argv) {
    try {
        Cli cli = parse_cli(argc, argv);

        fs::create_directories(cli.tmp_dir);

        // prepare CSV
        {
            std::ofstream ofs(cli.out_csv, std::ios::trunc);
            if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + cli.out_csv);
            ofs << "file,raw_bytes,compressed_bytes,payload_bits,compression_ratio,bits_per_byte,entropy_bits_per_byte,roundtrip_ok\n";
        }

        int failures = 0;
        for (const std::string& ref : cli.refs) {
            const std::string stem = fs::path(ref).filename().string();
            const std::string hufz_path = (fs::path(cli.tmp_dir) / (stem + ".hufz")).string();
            const std::string recon_path = (fs::path(cli.tmp_dir) / (stem + ".recon")).string();

            // encode
            hufz::CodecStats enc = hufz::encode_file(ref, hufz_path);
            const uint64_t compressed_bytes = fs::file_size(hufz_path);

            // decode
            hufz::decode_file(hufz_path, recon_path);
            const std::vector<uint8_t> raw = hufz::read_all(ref);
            const bool ok = raw == hufz::read_all(recon_path);
            if (!ok) ++failures;

            // rate metrics
            const double h = hufz::entropy_bits_per_byte(hufz::build_frequency_table(raw));
            const double cr = compressed_bytes > 0
                ? static_cast<double>(enc.input_bytes) / static_cast<double>(compressed_bytes) : 0.0;
            const double bpb = enc.input_bytes > 0
                ? static_cast<double>(enc.payload_bits) / static_cast<double>(enc.input_bytes) : 0.0;

            // append CSV
            {
                std::ofstream ofs(cli.out_csv, std::ios::app);
                if (!ofs.good()) throw std::runtime_error("Cannot append csv: " + cli.out_csv);
                ofs << stem << ","
                    << enc.input_bytes << ","
                    << compressed_bytes << ","
                    << enc.payload_bits << ","
                    << cr << ","
                    << bpb << ","
                    << h << ","
                    << (ok ? 1 : 0) << "\n";
            }
            std::cout << stem << ": " << enc.input_bytes << " -> " << compressed_bytes
                      << " bytes" << (ok ? "" : " [ROUND-TRIP MISMATCH]") << "\n";
        }

        std::cout << "Evaluation completed -> " << cli.out_csv << "\n";
        return failures == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
