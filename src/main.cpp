#include "Constant.hpp"
#include "DiskWriter.hpp"
#include "Logger.hpp"
#include "Manifest.hpp"
#include "PieceLayout.hpp"

#include <algorithm>
#include <argparse/argparse.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace {

/**
 * @brief Read one piece of the flat stream
 *
 * @param stream  the stream holding the concatenated content of the transfer
 * @param layout  the layout of the transfer
 * @param index   the index of the piece
 * @return the bytes of the piece, shorter than expected if the stream is truncated
 */
std::vector<std::byte> read_piece(
    std::ifstream& stream, const store::PieceLayout& layout, uint32_t index
) {
    std::vector<std::byte> data(layout.get_piece_length(index));

    stream.clear();
    stream.seekg(
        static_cast<std::streamoff>(index) * static_cast<std::streamoff>(layout.get_piece_size())
    );
    stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<size_t>(stream.gcount()));

    return data;
}

}  // namespace

int main(int argc, char** argv) {
    argparse::ArgumentParser arg_parser("piece-replay");

    arg_parser.add_description(
        "Cut a flat byte stream into pieces, deliver them in a shuffled order and assemble the "
        "output files described by the manifest"
    );

    arg_parser.add_argument("manifest").help("Manifest file: one \"<length> <path>\" per line");

    arg_parser.add_argument("stream").help(
        "File holding the concatenated content of the transfer"
    );

    arg_parser.add_argument("-o", "--output-dir")
        .help("Output directory")
        .default_value(std::string("."));

    arg_parser.add_argument("-p", "--piece-size")
        .help("Piece size in bytes")
        .default_value(static_cast<int64_t>(store::DEFAULT_PIECE_SIZE))
        .scan<'i', int64_t>();

    arg_parser.add_argument("-b", "--batch-size")
        .help("Number of pieces delivered between two drains")
        .default_value(16U)
        .scan<'u', unsigned>();

    arg_parser.add_argument("-s", "--seed")
        .help("Seed of the delivery order")
        .default_value(0U)
        .scan<'u', unsigned>();

    arg_parser.add_argument("-l", "--logging")
        .help("Enable logging")
        .default_value(false)
        .implicit_value(true);

    arg_parser.add_argument("-lf", "--log-file")
        .help("Path to the log file")
        .default_value(std::string("./piece-store.log"));

    try {
        arg_parser.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << arg_parser;
        return 1;
    }

    if (arg_parser.get<bool>("--logging")) {
#ifdef DEBUG
        store::logger::set_level(store::logger::Level::debug);
#else
        store::logger::set_level(store::logger::Level::info);
#endif
        store::logger::init(arg_parser.get<std::string>("--log-file"));
    } else {
        store::logger::set_level(store::logger::Level::off);
    }

    std::shared_ptr<const store::PieceLayout> layout;
    try {
        const auto manifest{
            store::md::parse_manifest_file(arg_parser.get<std::string>("manifest"))
        };
        layout = std::make_shared<const store::PieceLayout>(store::plan_layout(
            manifest,
            arg_parser.get<int64_t>("--piece-size"),
            arg_parser.get<std::string>("--output-dir")
        ));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::ifstream stream(arg_parser.get<std::string>("stream"), std::ios::binary | std::ios::in);
    if (!stream.is_open()) {
        std::cerr << "Failed to open stream file" << std::endl;
        return 1;
    }

    std::vector<uint32_t> order(layout->get_piece_count());
    std::iota(order.begin(), order.end(), 0U);
    std::shuffle(order.begin(), order.end(), std::mt19937{arg_parser.get<unsigned>("--seed")});

    const auto batch_size{std::max(arg_parser.get<unsigned>("--batch-size"), 1U)};

    store::DiskWriter disk_writer(layout);

    for (size_t i{0}; i < order.size(); ++i) {
        disk_writer.schedule(order[i], read_piece(stream, *layout, order[i]));

        if ((i + 1) % batch_size == 0) {
            disk_writer.drain();
        }
    }
    disk_writer.stop();

    const auto failed{disk_writer.take_failed_pieces()};
    for (auto piece_index : failed) {
        std::cerr << "Piece " << piece_index << " could not be written" << std::endl;
    }

    if (!disk_writer.all_assembled()) {
        std::cerr << "Some output files could not be assembled" << std::endl;
        return 1;
    }

    std::cout << "Assembled " << layout->get_outputs().size() << " file(s) in "
              << layout->get_root().string() << std::endl;

    return 0;
}
