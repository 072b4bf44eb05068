#include "quoridor_ai/negamax.hpp"
#include "quoridor/rules.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <utility>

using namespace quoridor_ai;
using namespace quoridor;

// Ordering score of a probe that cut a player off from their goal.
static constexpr Score kMissingDistance = -999.0;

static constexpr Score kPathStepBonus = 2.0;
static constexpr Score kBacktrackPenalty = 1.5;
static constexpr Score kRecentPenalty = 0.7;
static constexpr std::size_t kRecentSquares = 6;

// ============================================================================
// Negamax implementation
// ============================================================================

Negamax::Negamax()
  : use_move_ordering_(true), score_pawn_destinations_(false), pawn_nudges_(false), prefer_faster_wins_(false),
    detect_repetition_(false), verbose_(false) {
  stats_.reset();
}

Score Negamax::evaluate_for_mover(const GameState& s) const {
  const Score e = Rules::evaluate(s);
  return (s.current_player() == Player::North) ? e : -e;
}

/**
 * 手の順序付け（Move Ordering）
 *
 * 壁: 仮に置いて (相手の最短距離 - 自分の最短距離) を計算し、すぐに取り除く
 * 駒: 既定では着手前の距離差を全ての駒移動に同じく与える
 *     (score_pawn_destinations_ の場合は移動後の距離差)
 *     pawn_nudges_ の場合は棋譜から補正: 最短経路の一歩目 +2.0,
 *     直前のマスへ戻る -1.5, 直近6手で居たマス -0.7
 * スコアの降順に安定ソート
 */
MoveList Negamax::ordered_moves(GameState& s) const {
  MoveList moves;
  Rules::legal_moves(s, moves);
  if (!use_move_ordering_ || moves.size() <= 1) {
    return moves;
  }

  const Player me = s.current_player();
  const Player you = opponent(me);

  auto differential = [&]() -> Score {
    const auto d_me = Rules::distance_to_goal(s, me);
    const auto d_you = Rules::distance_to_goal(s, you);
    if (!d_me || !d_you) return kMissingDistance;
    return static_cast<Score>(*d_you - *d_me);
  };

  const int d_me0 = Rules::distance_to_goal(s, me).value_or(0);
  const int d_you0 = Rules::distance_to_goal(s, you).value_or(0);
  const Score baseline = static_cast<Score>(d_you0 - d_me0);

  // 棋譜はsearch中のmake/unmakeでは変わらないので一度だけ計算
  std::optional<Coord> path_step;
  std::vector<Coord> recent;
  if (pawn_nudges_) {
    const auto step = s.board().astar_next_step(s.pawn(me), s.goal_rows(me));
    if (step && step->next != s.pawn(me)) path_step = step->next;
    recent = s.recent_squares(me, kRecentSquares);
  }

  std::vector<std::pair<Score, Move>> scored;
  scored.reserve(moves.size());

  for (const auto& move : moves) {
    Score score = baseline;
    if (move.is_wall()) {
      ScopedWall probe(s.board(), move.wall());
      score = differential();
    } else if (score_pawn_destinations_) {
      const MoveDelta d = s.make_move(move);
      score = differential();
      s.unmake_move(d);
    }
    if (move.is_pawn() && pawn_nudges_) {
      const Coord& to = move.to();
      if (path_step && to == *path_step) score += kPathStepBonus;
      if (!recent.empty() && to == recent.front()) score -= kBacktrackPenalty;
      if (std::find(recent.begin(), recent.end(), to) != recent.end()) score -= kRecentPenalty;
    }
    scored.emplace_back(score, move);
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });

  for (size_t i = 0; i < moves.size(); ++i) {
    moves[i] = scored[i].second;
  }
  return moves;
}

/**
 * アルファベータ探索の本体（Negamax形式）
 */
SearchResult Negamax::negamax(GameState& s, int depth, Score alpha, Score beta) {
  stats_.nodes_searched++;

  // 終局チェック: 残り深さに関係なく一定のスコア
  if (const auto w = Rules::winner(s)) {
    const Score win = prefer_faster_wins_ ? kWinScore + depth : kWinScore;
    return SearchResult{(*w == s.current_player()) ? win : -win, std::nullopt};
  }

  // 深さ制限
  if (depth <= 0) {
    return SearchResult{evaluate_for_mover(s), std::nullopt};
  }

  if (detect_repetition_) {
    Snapshot key = s.snapshot();
    if (std::find(path_.begin(), path_.end(), key) != path_.end()) {
      stats_.repetitions++;
      return SearchResult{-0.001 * depth, std::nullopt};
    }
    path_.push_back(std::move(key));
  }

  const MoveList moves = ordered_moves(s);

  SearchResult best{-kInfinity, std::nullopt};
  if (moves.empty()) {
    // pawn boxed in by walls and the opponent, nothing to play
    best.score = evaluate_for_mover(s);
  }

  for (const auto& move : moves) {
    const MoveDelta d = s.make_move(move);
    const Score value = -negamax(s, depth - 1, -beta, -alpha).score;
    s.unmake_move(d);

    if (value > best.score) {
      best.score = value;
      best.move = move;
    }

    alpha = std::max(alpha, best.score);

    // ベータカット
    if (alpha >= beta) {
      stats_.beta_cutoffs++;
      break;
    }
  }

  if (detect_repetition_) {
    path_.pop_back();
  }
  return best;
}

SearchResult Negamax::search(GameState& s, int depth, Score alpha, Score beta) {
  stats_.reset();
  path_.clear();

  auto start_time = std::chrono::steady_clock::now();
  SearchResult result = negamax(s, depth, alpha, beta);
  auto end_time = std::chrono::steady_clock::now();

  stats_.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  stats_.max_depth_reached = depth;

  if (verbose_) {
    std::cerr << "[Negamax] Depth " << depth
              << " | Value: " << result.score
              << " | Move: " << (result.move ? to_string(*result.move) : "none")
              << " | Nodes: " << stats_.nodes_searched
              << " | Beta cuts: " << stats_.beta_cutoffs
              << " | Time: " << stats_.time_ms << "ms" << std::endl;
  }
  return result;
}

/**
 * メイン探索関数（反復深化、深さまたは時間指定）
 */
std::optional<Move> Negamax::best_move(const GameState& s, int max_depth, int time_ms) {
  stats_.reset();
  path_.clear();

  if (Rules::winner(s)) {
    return std::nullopt;
  }

  GameState work = s;
  const Player me = work.current_player();

  // Determine effective time limit (ms). If time_ms <= 0, allow env var QUORIDOR_MOVE_TIME (seconds).
  int effective_time_ms = time_ms;
  if (effective_time_ms <= 0) {
    const char* env = std::getenv("QUORIDOR_MOVE_TIME");
    if (env) {
      double secs = std::atof(env);
      if (secs > 0.0) {
        const double ms = std::min(secs * 1000.0, static_cast<double>(std::numeric_limits<int>::max()));
        effective_time_ms = static_cast<int>(ms);
      }
    }
  }

  // No walls left: nothing to plan around, follow the shortest path
  if (work.walls_left(me) <= 0) {
    const auto step = work.board().astar_next_step(work.pawn(me), work.goal_rows(me));
    if (step && step->next != work.pawn(me)) {
      const Move m = Move::pawn(step->next);
      if (Rules::is_legal(work, m)) {
        if (verbose_) {
          std::cerr << "[Negamax] No walls left, following shortest path: " << to_string(m) << std::endl;
        }
        return m;
      }
    }
  }

  if (verbose_) {
    std::cerr << "[Negamax] Starting search (depth=" << max_depth << ", time_ms=" << effective_time_ms << ")..." << std::endl;
  }

  auto start_time = std::chrono::steady_clock::now();
  auto deadline = start_time + std::chrono::milliseconds(effective_time_ms);

  std::optional<Move> best;
  for (int d = 1; d <= max_depth; ++d) {
    SearchResult r = negamax(work, d, -kInfinity, kInfinity);
    stats_.max_depth_reached = d;
    if (r.move) best = r.move;

    if (verbose_) {
      std::cerr << "[Negamax] Depth " << d << "/" << max_depth
                << " | Value: " << r.score
                << " | Nodes: " << stats_.nodes_searched
                << " | Beta cuts: " << stats_.beta_cutoffs << std::endl;
    }

    // 時間チェック
    if (effective_time_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }

  auto end_time = std::chrono::steady_clock::now();
  stats_.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

  if (!best) {
    MoveList moves;
    Rules::legal_moves(work, moves);
    if (!moves.empty()) best = moves.front();
  }

  if (verbose_) {
    std::cout << "[Negamax] Search complete | Depth: " << stats_.max_depth_reached
              << " | Nodes: " << stats_.nodes_searched
              << " | Time: " << stats_.time_ms << "ms"
              << " | NPS: " << (stats_.nodes_searched * 1000 / std::max<int64_t>(stats_.time_ms, 1)) << "\n";
  }
  return best;
}
