#include "engine/PieceIndex.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using tl::engine::FileInfo;
using tl::engine::GeometryError;
using tl::engine::PieceIndex;
using tl::engine::PieceInfo;

namespace
{

FileInfo file(std::string path, std::int64_t offset, std::int64_t length)
{
    return FileInfo{path, path, offset, length};
}

} // namespace

TEST_CASE("ranges_overlap uses half-open intervals")
{
    CHECK(PieceIndex::ranges_overlap(0, 10, 5, 15));
    CHECK(PieceIndex::ranges_overlap(5, 15, 0, 10));
    CHECK_FALSE(PieceIndex::ranges_overlap(0, 10, 10, 20));
    CHECK_FALSE(PieceIndex::ranges_overlap(10, 10, 0, 20));
}

TEST_CASE("a piece spanning several files maps to all of them")
{
    // Files of 3, 0, 2 and 5 bytes under two 6-byte pieces (the last one
    // shortened to 4).
    PieceIndex index({file("a", 0, 3), file("empty", 3, 0), file("b", 3, 2),
                      file("c", 5, 5)},
                     {PieceInfo{0, 0, 6}, PieceInfo{1, 6, 4}});

    CHECK(index.files_for_piece(0) ==
          std::vector<std::string>{"a", "b", "c"});
    CHECK(index.files_for_piece(1) == std::vector<std::string>{"c"});
    CHECK(index.pieces_for_file("a") == std::vector<int>{0});
    CHECK(index.pieces_for_file("c") == std::vector<int>{0, 1});
    CHECK(index.pieces_for_file("empty").empty());
    CHECK(index.files_for_piece(7).empty());
}

TEST_CASE("zero-length trailing piece overlaps nothing")
{
    PieceIndex index({file("a", 0, 4)},
                     {PieceInfo{0, 0, 4}, PieceInfo{1, 4, 0}});
    CHECK(index.files_for_piece(1).empty());
    CHECK(index.pieces_for_file("a") == std::vector<int>{0});
}

TEST_CASE("malformed geometry is rejected")
{
    SUBCASE("gap between files")
    {
        CHECK_THROWS_AS(PieceIndex({file("a", 0, 4), file("b", 5, 4)},
                                   {PieceInfo{0, 0, 9}}),
                        GeometryError);
    }
    SUBCASE("duplicate path")
    {
        CHECK_THROWS_AS(PieceIndex({file("a", 0, 4), file("a", 4, 4)},
                                   {PieceInfo{0, 0, 8}}),
                        GeometryError);
    }
    SUBCASE("negative length")
    {
        CHECK_THROWS_AS(PieceIndex({file("a", 0, -1)}, {}), GeometryError);
    }
    SUBCASE("pieces out of order")
    {
        CHECK_THROWS_AS(PieceIndex({file("a", 0, 8)},
                                   {PieceInfo{1, 0, 4}, PieceInfo{0, 4, 4}}),
                        GeometryError);
    }
    SUBCASE("overlapping pieces")
    {
        CHECK_THROWS_AS(PieceIndex({file("a", 0, 8)},
                                   {PieceInfo{0, 0, 4}, PieceInfo{1, 2, 6}}),
                        GeometryError);
    }
}
