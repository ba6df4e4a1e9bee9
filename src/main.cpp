#include "config.hpp"
#include "decode_pipeline.hpp"
#include "encode_pipeline.hpp"
#include "qr_codec.hpp"
#include "transfer_error.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " encode <file> [--chunk-size N] [--rows R] [--cols C] [--output PATH]\n"
              << "  " << prog << " decode <image> [--output-dir DIR] [--debug]\n"
              << "Defaults: chunk size " << DEFAULT_CHUNK_SIZE << ", grid auto, output <name>_qr_array.png,\n"
              << "          output dir '.'" << std::endl;
}

static int parse_positive(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw TransferError(ErrorKind::InvalidArgument, flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size() || n <= 0)
        throw TransferError(ErrorKind::InvalidArgument, flag + " expects a positive integer, got '" + value + "'");
    return n;
}

static int run_encode(int argc, char** argv) {
    std::string file = argv[2];
    std::optional<int> rows;
    std::optional<int> cols;
    std::string output;
    TransferConfig config;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--chunk-size") config.chunk_size = static_cast<size_t>(parse_positive(arg, value));
        else if (arg == "--rows") rows = parse_positive(arg, value);
        else if (arg == "--cols") cols = parse_positive(arg, value);
        else if (arg == "--output") output = value;
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    QrCodec codec(config);
    EncodePipeline pipeline(codec, config);
    EncodeResult result = pipeline.encode_file(file, rows, cols, output);

    std::cout << "Generated " << result.num_chunks << " QR codes in " << result.grid.rows << "x"
              << result.grid.cols << " grid: " << result.output_path << std::endl;
    return 0;
}

static int run_decode(int argc, char** argv) {
    std::string image = argv[2];
    std::string output_dir = ".";
    bool debug = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            debug = true;
        } else if (arg == "--output-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 1;
            }
            output_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    TransferConfig config;
    QrCodec codec(config);
    DecodePipeline pipeline(codec);
    DecodeResult result = pipeline.decode_to_directory(image, output_dir, debug);

    if (!result.success) {
        std::cerr << "Decode failed at " << to_string(result.stage_reached) << " ("
                  << to_string(result.error_kind) << "): " << result.error << std::endl;
        std::cerr << "Try a sharper image, or re-encode with a smaller --chunk-size." << std::endl;
        return 1;
    }

    std::cout << "Recovered " << to_string(result.payload.kind) << " file: " << result.output_path << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "encode") return run_encode(argc, argv);
        if (command == "decode") return run_decode(argc, argv);
    } catch (const TransferError& e) {
        std::cerr << "[ERROR] " << to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
