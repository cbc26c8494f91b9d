// TypeProof - Leaderboard Ranking
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Per-challenge top table: at most TOP_N rows, one per player, ordered by
// score descending with ties broken by ascending player key.

#ifndef TYPEPROOF_LEDGER_RANKING_H
#define TYPEPROOF_LEDGER_RANKING_H

#include "typeproof/ledger/entries.h"

#include <vector>

namespace typeproof {
namespace ledger {

/// Ranking order: negative if a ranks above b, zero only for equal players
/// with equal scores
int CompareRows(const LeaderboardRow& a, const LeaderboardRow& b);

/// Sort a table into ranking order
void SortRows(std::vector<LeaderboardRow>& rows);

/**
 * Merge a row into a top table.
 *
 * An existing row for the same player is replaced in place, whatever the
 * new score. Otherwise the row is appended while the table has room, or
 * replaces the lowest score when it beats it strictly.
 *
 * @return false if the row was discarded and the table left untouched
 */
bool UpsertTopTable(std::vector<LeaderboardRow>& table, const LeaderboardRow& row);

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_RANKING_H
