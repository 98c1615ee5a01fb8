#pragma once

#include "types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace xiangqi {

// What make_move needs to put the board back.
struct UndoMove {
    Move move{};
    std::optional<Piece> captured;
};

class Board {
public:
    Board() = default;

    // Empty for off-board coordinates.
    const std::optional<Piece>& at(const Coord& c) const;
    const std::optional<Piece>& at(int row, int col) const { return at(Coord{row, col}); }
    bool occupied(int row, int col) const { return at(row, col).has_value(); }

    // Fails off the board, on an occupied square, or for a second General.
    bool place(PieceKind kind, Side side, const Coord& c);
    std::optional<Piece> remove(const Coord& c);

    // Relocates whatever stands on `from`; returns the piece it displaced.
    // No rule checks, callers validate first.
    std::optional<Piece> move(const Coord& from, const Coord& to);

    bool make_move(const Move& m, UndoMove& u);
    void unmake_move(const UndoMove& u);

    void clear();
    void setup_standard();

    std::vector<Piece> pieces() const;
    std::vector<Piece> pieces_of(Side side) const;
    std::vector<Piece> pieces_of(PieceKind kind, Side side) const;
    int piece_count() const { return count_; }
    std::optional<Coord> find_general(Side side) const;

    // Both Generals on one column with nothing between them.
    bool generals_facing() const;

private:
    std::array<std::optional<Piece>, SQUARES> cells_{};
    int count_ = 0;
};

Board standard_board();

} // namespace xiangqi
