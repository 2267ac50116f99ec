#include "piecenet/p2p/store.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace piecenet;
using namespace piecenet::p2p;

TEST(StoreTest, Sha256)
{
    std::string data = "abc";
    GTEST_ASSERT_EQ(sha256_digest((const byte *)data.data(), data.size()),
                    "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(StoreTest, PiecesOrderedByNumber)
{
    memory_store_t store;
    for (u32 number : {2u, 0u, 1u})
    {
        piece_record_t piece;
        piece.task_id = "task";
        piece.number = number;
        store.add_piece(piece);
    }

    auto pieces = store.list_pieces("task");
    GTEST_ASSERT_EQ(pieces.size(), 3u);
    for (u32 i = 0; i < 3; i++)
    {
        GTEST_ASSERT_EQ(pieces[i].number, i);
        GTEST_ASSERT_EQ(pieces[i].id, make_piece_id("task", i));
    }
    GTEST_ASSERT_EQ(store.list_pieces("unknown").empty(), true);
    GTEST_ASSERT_EQ(store.lookup_piece("task-1").has_value(), true);
    GTEST_ASSERT_EQ(store.lookup_piece("task-3").has_value(), false);
    /// persistent cache pieces live apart
    GTEST_ASSERT_EQ(store.lookup_persistent_cache_piece("task-1").has_value(), false);
}

TEST(StoreTest, WireProjection)
{
    piece_record_t piece;
    piece.task_id = "task";
    piece.number = 1;
    piece.offset = 4;
    piece.length = 2;
    piece.content = "xy";
    piece.digest = "sha256:00";
    piece.storage_key = "secret-key";
    piece.storage_path = "/var/lib/secret";

    auto wire = to_wire(piece);
    GTEST_ASSERT_EQ(wire.content(), "xy");
    GTEST_ASSERT_EQ(wire.has_parent_id(), false);
    GTEST_ASSERT_EQ(wire.has_traffic_type(), false);
    GTEST_ASSERT_EQ(wire.SerializeAsString().find("secret"), std::string::npos);

    task_record_t task;
    task.id = "task";
    task.storage_path = "/var/lib/secret";
    auto task_wire = to_wire(task, {piece});
    GTEST_ASSERT_EQ(task_wire.pieces_size(), 1);
    GTEST_ASSERT_EQ(task_wire.pieces(0).has_content(), false);
    GTEST_ASSERT_EQ(task_wire.has_piece_count(), false);
    GTEST_ASSERT_EQ(task_wire.SerializeAsString().find("secret"), std::string::npos);
}

TEST(StoreTest, LoadDirectory)
{
    auto dir = std::filesystem::temp_directory_path() / ("piecenet-store-" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "blob") << "abcdefghij";

    memory_store_t store;
    GTEST_ASSERT_EQ(store.load_directory(dir.string(), 4), 1u);

    auto task = store.lookup_task("blob");
    GTEST_ASSERT_EQ(task.has_value(), true);
    GTEST_ASSERT_EQ(*task->content_length, 10u);
    GTEST_ASSERT_EQ(*task->piece_count, 3u);

    auto pieces = store.list_pieces("blob");
    GTEST_ASSERT_EQ(pieces.size(), 3u);
    GTEST_ASSERT_EQ(*pieces[0].content, "abcd");
    GTEST_ASSERT_EQ(*pieces[2].content, "ij");
    GTEST_ASSERT_EQ(pieces[2].offset, 8u);
    GTEST_ASSERT_EQ(pieces[2].length, 2u);
    GTEST_ASSERT_EQ(pieces[1].digest, sha256_digest((const byte *)"efgh", 4));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    EXPECT_THROW(store.load_directory(dir.string(), 4), storage_exception);
}
