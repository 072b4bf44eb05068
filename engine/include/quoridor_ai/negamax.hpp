#pragma once
#include "quoridor/game_state.hpp"
#include "quoridor/move.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace quoridor_ai {

constexpr quoridor::Score kWinScore = 1000000.0;
constexpr quoridor::Score kInfinity = std::numeric_limits<quoridor::Score>::infinity();

struct SearchResult {
  quoridor::Score score = 0.0;
  std::optional<quoridor::Move> move;
};

/**
 * Negamax with alpha-beta pruning (fail-soft).
 *
 * Scores are relative to the side to move. Moves are made and unmade on
 * the caller's state in place, so the state is unchanged when search()
 * returns. The board must not be shared with another running search.
 */
class Negamax {
public:
  Negamax();

  // Depth-limited search of s. Default window is (-inf, +inf).
  SearchResult search(quoridor::GameState& s, int depth,
                      quoridor::Score alpha = -kInfinity, quoridor::Score beta = kInfinity);

  // Iterative deepening up to max_depth on a copy of s. time_ms <= 0 falls
  // back to QUORIDOR_MOVE_TIME (seconds), and then to no time limit.
  std::optional<quoridor::Move> best_move(const quoridor::GameState& s, int max_depth = 3, int time_ms = -1);

  // Candidate moves for the side to move, most promising first.
  quoridor::MoveList ordered_moves(quoridor::GameState& s) const;

  void set_use_move_ordering(bool use) { use_move_ordering_ = use; }
  // Score each pawn destination by its resulting distance differential
  // instead of the shared pre-move baseline.
  void set_score_pawn_destinations(bool use) { score_pawn_destinations_ = use; }
  // Pawn moves from the game record: +2.0 for the first step of the mover's
  // shortest path, -1.5 for stepping back to the previous square, -0.7 for
  // any of the mover's last 6 squares.
  void set_pawn_nudges(bool use) { pawn_nudges_ = use; }
  // Terminal scores grow with the remaining depth, so faster wins rank higher.
  void set_prefer_faster_wins(bool use) { prefer_faster_wins_ = use; }
  // A position repeated on the current search path scores -0.001 * depth.
  void set_detect_repetition(bool use) { detect_repetition_ = use; }
  void set_verbose(bool v) { verbose_ = v; }

  struct Stats {
    int64_t nodes_searched;
    int64_t beta_cutoffs;
    int64_t repetitions;  // nodes cut short by the repetition guard
    int max_depth_reached;
    int64_t time_ms;

    void reset() {
      nodes_searched = 0;
      beta_cutoffs = 0;
      repetitions = 0;
      max_depth_reached = 0;
      time_ms = 0;
    }
  };

  const Stats& get_stats() const { return stats_; }

private:
  SearchResult negamax(quoridor::GameState& s, int depth, quoridor::Score alpha, quoridor::Score beta);

  // Static evaluation seen from the side to move.
  quoridor::Score evaluate_for_mover(const quoridor::GameState& s) const;

  bool use_move_ordering_;
  bool score_pawn_destinations_;
  bool pawn_nudges_;
  bool prefer_faster_wins_;
  bool detect_repetition_;
  bool verbose_;
  Stats stats_;

  std::vector<quoridor::Snapshot> path_;  // positions on the current line, for repetition checks
};

} // namespace quoridor_ai
