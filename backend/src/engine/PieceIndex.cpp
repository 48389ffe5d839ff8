#include "engine/PieceIndex.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>
#include <utility>

namespace tl::engine
{

namespace
{
std::vector<std::string> const kNoFiles;
std::vector<int> const kNoPieces;
} // namespace

PieceIndex::PieceIndex(std::vector<FileInfo> files,
                       std::vector<PieceInfo> pieces)
    : files_(std::move(files)), pieces_(std::move(pieces))
{
    validate();
    build();
}

void PieceIndex::validate() const
{
    std::int64_t expected = 0;
    std::unordered_set<std::string> seen;
    for (auto const &file : files_)
    {
        if (file.length < 0)
        {
            throw GeometryError(
                std::format("file {} has negative length", file.path));
        }
        if (file.offset != expected)
        {
            throw GeometryError(
                std::format("file {} starts at {}, expected {}", file.path,
                            file.offset, expected));
        }
        if (!seen.insert(file.path).second)
        {
            throw GeometryError(
                std::format("file {} listed twice", file.path));
        }
        expected = file.offset + file.length;
    }

    expected = 0;
    for (std::size_t i = 0; i < pieces_.size(); ++i)
    {
        auto const &piece = pieces_[i];
        if (piece.index != static_cast<int>(i))
        {
            throw GeometryError(std::format(
                "piece at position {} has index {}", i, piece.index));
        }
        if (piece.length < 0)
        {
            throw GeometryError(
                std::format("piece {} has negative length", piece.index));
        }
        if (piece.offset != expected)
        {
            throw GeometryError(
                std::format("piece {} starts at {}, expected {}", piece.index,
                            piece.offset, expected));
        }
        expected = piece.offset + piece.length;
    }
}

void PieceIndex::build()
{
    for (auto const &piece : pieces_)
    {
        if (piece.length == 0)
        {
            continue;
        }
        auto const piece_begin = piece.offset;
        auto const piece_end = piece.offset + piece.length;

        // Files are sorted and contiguous, so their end offsets are
        // non-decreasing: find the first file ending past the piece start.
        auto it = std::partition_point(
            files_.begin(), files_.end(), [piece_begin](FileInfo const &file)
            { return file.offset + file.length <= piece_begin; });
        for (; it != files_.end() && it->offset < piece_end; ++it)
        {
            if (it->length == 0 ||
                !ranges_overlap(piece_begin, piece_end, it->offset,
                                it->offset + it->length))
            {
                continue;
            }
            piece_files_[piece.index].push_back(it->path);
            file_pieces_[it->path].push_back(piece.index);
        }
    }
}

std::vector<std::string> const &PieceIndex::files_for_piece(int index) const
{
    auto it = piece_files_.find(index);
    return it == piece_files_.end() ? kNoFiles : it->second;
}

std::vector<int> const &
PieceIndex::pieces_for_file(std::string const &path) const
{
    auto it = file_pieces_.find(path);
    return it == file_pieces_.end() ? kNoPieces : it->second;
}

} // namespace tl::engine
