// TypeProof - Leaderboard Ranking
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/ranking.h"

#include <utility>

namespace typeproof {
namespace ledger {

int CompareRows(const LeaderboardRow& a, const LeaderboardRow& b) {
    if (a.score > b.score) return -1;
    if (a.score < b.score) return 1;
    if (a.player < b.player) return -1;
    if (b.player < a.player) return 1;
    return 0;
}

void SortRows(std::vector<LeaderboardRow>& rows) {
    // Selection sort; tables hold at most TOP_N rows
    const size_t n = rows.size();
    for (size_t i = 0; i < n; ++i) {
        size_t best = i;
        for (size_t j = i + 1; j < n; ++j) {
            if (CompareRows(rows[j], rows[best]) < 0) {
                best = j;
            }
        }
        if (best != i) {
            std::swap(rows[i], rows[best]);
        }
    }
}

bool UpsertTopTable(std::vector<LeaderboardRow>& table, const LeaderboardRow& row) {
    bool replaced = false;
    for (auto& existing : table) {
        if (existing.player == row.player) {
            existing = row;
            replaced = true;
            break;
        }
    }

    if (!replaced) {
        if (table.size() < TOP_N) {
            table.push_back(row);
        } else {
            size_t minIdx = 0;
            for (size_t i = 1; i < table.size(); ++i) {
                if (table[i].score < table[minIdx].score) {
                    minIdx = i;
                }
            }
            if (row.score <= table[minIdx].score) {
                return false;
            }
            table[minIdx] = row;
        }
    }

    SortRows(table);
    if (table.size() > TOP_N) {
        table.resize(TOP_N);
    }
    return true;
}

} // namespace ledger
} // namespace typeproof
