#include "DiskWriter.hpp"
#include "TestUtils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace store;
using namespace std::literals::chrono_literals;
using test_utils::read_file;
using test_utils::to_bytes;

TEST_CASE("DiskWriter: periodic drain", "[DiskWriter]") {
    test_utils::TempDir dir;
    const md::Manifest  manifest{{"a.txt", 5}, {"dir/b.txt", 7}, {"c.txt", 3}};
    const auto          layout{
        std::make_shared<const PieceLayout>(plan_layout(manifest, 4, dir.path()))
    };
    const auto          content{test_utils::make_content(15)};
    const auto          files{test_utils::split_content(manifest, content)};
    auto                pieces{test_utils::make_pieces(*layout, content)};

    SECTION("Pieces scheduled from several threads are assembled by the background task") {
        DiskWriter disk_writer(layout, 10ms);
        disk_writer.start();

        {
            std::vector<std::jthread> producers;
            for (auto& piece : pieces) {
                producers.emplace_back([&disk_writer, &piece] {
                    disk_writer.schedule(piece.index, std::move(piece.data));
                });
            }
        }

        const auto deadline{std::chrono::steady_clock::now() + 5s};
        while (!disk_writer.all_assembled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }

        REQUIRE(disk_writer.all_assembled());
        REQUIRE(disk_writer.get_buffered_count() == 0);
        REQUIRE(read_file(dir.path() / "a.txt") == files[0]);
        REQUIRE(read_file(dir.path() / "dir" / "b.txt") == files[1]);
        REQUIRE(read_file(dir.path() / "c.txt") == files[2]);
    }

    SECTION("Stopping drains the remaining pieces") {
        DiskWriter disk_writer(layout, 1h);
        disk_writer.start();

        for (auto& piece : pieces) {
            disk_writer.schedule(piece.index, std::move(piece.data));
        }
        REQUIRE(disk_writer.get_buffered_count() == pieces.size());

        disk_writer.stop();

        REQUIRE(disk_writer.get_buffered_count() == 0);
        REQUIRE(disk_writer.all_assembled());
        REQUIRE(read_file(dir.path() / "dir" / "b.txt") == files[1]);
    }

    SECTION("Explicit drains without the background task") {
        DiskWriter disk_writer(layout);

        disk_writer.schedule(pieces[3].index, pieces[3].data);
        disk_writer.schedule(pieces[0].index, pieces[0].data);
        disk_writer.drain();
        REQUIRE(!disk_writer.all_assembled());
        REQUIRE(!std::filesystem::exists(dir.path() / "a.txt"));

        disk_writer.schedule(pieces[1].index, pieces[1].data);
        disk_writer.schedule(pieces[2].index, pieces[2].data);
        disk_writer.drain();

        REQUIRE(disk_writer.all_assembled());
        REQUIRE(read_file(dir.path() / "a.txt") == files[0]);
        REQUIRE(read_file(dir.path() / "c.txt") == files[2]);
    }

    SECTION("Failed pieces are reported for redelivery") {
        DiskWriter disk_writer(layout);

        for (const auto& piece : pieces) {
            if (piece.index == 2) {
                disk_writer.schedule(piece.index, to_bytes("xx"));
            } else {
                disk_writer.schedule(piece.index, piece.data);
            }
        }
        disk_writer.drain();

        REQUIRE(disk_writer.take_failed_pieces() == std::vector<uint32_t>{2});
        REQUIRE(disk_writer.take_failed_pieces().empty());
        REQUIRE(!disk_writer.all_assembled());

        disk_writer.schedule(pieces[2].index, pieces[2].data);
        disk_writer.drain();

        REQUIRE(disk_writer.all_assembled());
        REQUIRE(read_file(dir.path() / "dir" / "b.txt") == files[1]);
    }

    SECTION("Drain interval must be positive") {
        REQUIRE_THROWS(DiskWriter(layout, 0ms));
    }
}
