#pragma once

#include "board.hpp"

#include <vector>

namespace xiangqi {

// Per-kind movement rules only: no turn order, no flying-general check.
bool is_valid_move(const Board& board, const Coord& from, const Coord& to);

// Squares the piece on `from` could reach by shape alone. Every square the
// validator accepts is in this list.
std::vector<Coord> candidate_destinations(const Board& board, const Coord& from);

// Validator-accepted destinations for the piece on `from`.
std::vector<Coord> valid_destinations(const Board& board, const Coord& from);

// Pieces strictly between two squares on one row or column, -1 otherwise.
int count_between(const Board& board, const Coord& a, const Coord& b);

// Piece on `from` guards the friendly piece on `to`.
bool defends(const Board& board, const Coord& from, const Coord& to);

bool attacks(const Board& board, const Coord& from, const Coord& target);

// An enemy piece can capture the side's General, or the Generals face.
bool in_check(const Board& board, Side side);

// Every validator-accepted move of `side` that does not leave the Generals
// facing each other. Self-check is not filtered.
std::vector<Move> legal_moves(const Board& board, Side side);

// In-place variant for search; the board is restored before returning.
void generate_moves(Board& board, Side side, std::vector<Move>& out);

// Same filter for a single move.
bool is_legal_move(const Board& board, Side side, const Move& m);

} // namespace xiangqi
