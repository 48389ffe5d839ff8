#pragma once

#include "engine/Transfer.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace tl::engine
{

// Raised when file or piece ranges are not sorted and contiguous.
class GeometryError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Immutable piece <-> file overlap maps of one transfer. Zero-length pieces
// and files never appear in either map.
class PieceIndex
{
  public:
    PieceIndex(std::vector<FileInfo> files, std::vector<PieceInfo> pieces);

    static bool ranges_overlap(std::int64_t a_begin, std::int64_t a_end,
                               std::int64_t b_begin,
                               std::int64_t b_end) noexcept
    {
        return a_end > b_begin && b_end > a_begin;
    }

    std::vector<std::string> const &files_for_piece(int index) const;
    std::vector<int> const &pieces_for_file(std::string const &path) const;

    std::vector<FileInfo> const &files() const noexcept { return files_; }
    std::vector<PieceInfo> const &pieces() const noexcept { return pieces_; }

  private:
    void validate() const;
    void build();

    std::vector<FileInfo> files_;
    std::vector<PieceInfo> pieces_;
    std::unordered_map<int, std::vector<std::string>> piece_files_;
    std::unordered_map<std::string, std::vector<int>> file_pieces_;
};

} // namespace tl::engine
