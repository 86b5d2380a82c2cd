#include "test_util.hpp"
#include "kingcap/movegen.hpp"
#include "kingcap/search.hpp"

using namespace kingcap;

TEST(Search, NoLegalMovesIsReported){
    Position p = fenPos("kp6/pp6/pp6/pp6/pp6/pp6/pp6/pp5K b");
    EXPECT_FALSE(best_move(p, 1, Algorithm::Minimax).has_value());
    EXPECT_FALSE(best_move(p, 3, Algorithm::AlphaBeta).has_value());
}

TEST(Search, TakesHangingQueen){
    Position p = fenPos("4k3/8/8/3q4/8/8/8/3RK3 w");
    for (auto algo : {Algorithm::Minimax, Algorithm::AlphaBeta}) {
        auto res = best_move(p, 1, algo);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(move_name(res->move), "d1d5");
        EXPECT_EQ(res->score, 10);
    }
}

TEST(Search, WhiteCapturesKingAsSoonAsPossible){
    Position p = fenPos("8/8/8/8/8/8/3k4/3RK3 w");
    auto d2 = best_move(p, 2);
    ASSERT_TRUE(d2.has_value());
    EXPECT_EQ(move_name(d2->move), "d1d2"); // earliest of the two king captures
    EXPECT_EQ(d2->score, 160 * 2);
    auto d3 = best_move(p, 3, Algorithm::Minimax);
    ASSERT_TRUE(d3.has_value());
    EXPECT_EQ(move_name(d3->move), "d1d2");
    EXPECT_EQ(d3->score, 160 * 3);
}

TEST(Search, BlackMinimizes){
    Position p = fenPos("3rk3/3K4/8/8/8/8/8/8 b");
    auto res = best_move(p, 1);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(move_name(res->move), "d8d7");
    EXPECT_EQ(res->score, -160);
}

TEST(Search, EqualScoresKeepFirstMove){
    Position p = fenPos("4k3/8/8/8/8/8/8/4K3 b");
    auto moves = legal_moves(p);
    ASSERT_FALSE(moves.empty());
    auto res = best_move(p, 1);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->score, 0);
    EXPECT_EQ(res->move, moves.front());
}

TEST(Search, KingsOnlyPrefersTopRankFirst){
    Position p = fenPos("4k3/8/8/8/8/8/8/4K3 b");
    for (auto algo : {Algorithm::Minimax, Algorithm::AlphaBeta}) {
        auto res = best_move(p, 1, algo);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(res->score, 0);
        EXPECT_EQ(move_name(res->move), "e8d8");
    }
}

TEST(Search, ReplyWithoutMovesIsScoredStatically){
    // Every white king move leaves black with no legal reply; that node is
    // scored as a leaf with one ply left: (150 - 165) * 2.
    Position p = fenPos("kp6/pp6/pp6/pp6/pp6/pp6/pp6/pp5K w");
    auto moves = legal_moves(p);
    ASSERT_FALSE(moves.empty());
    for (const auto& m : moves) EXPECT_TRUE(legal_moves(p.apply(m)).empty()) << move_name(m);
    for (auto algo : {Algorithm::Minimax, Algorithm::AlphaBeta}) {
        auto res = best_move(p, 2, algo);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(res->score, -30);
        EXPECT_EQ(res->move, moves.front());
    }
}

TEST(Search, DepthBelowOneActsAsOne){
    Position p = fenPos("4k3/8/8/3q4/8/8/8/3RK3 w");
    auto a = best_move(p, 0);
    auto b = best_move(p, 1);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->move, b->move);
    EXPECT_EQ(a->score, b->score);
}

TEST(Search, RepeatedCallsAgree){
    Position p = fenPos("r3k3/pp6/8/3q4/3Q4/8/6PP/4K2R w");
    Position before = p;
    auto a = best_move(p, 2);
    auto b = best_move(p, 2);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->move, b->move);
    EXPECT_EQ(a->score, b->score);
    EXPECT_EQ(p, before);
}

class SearchAgreement : public ::testing::TestWithParam<const char*> {};

TEST_P(SearchAgreement, AlphaBetaMatchesMinimax){
    Position p = fenPos(GetParam());
    for (int depth = 1; depth <= 3; ++depth) {
        auto mm = best_move(p, depth, Algorithm::Minimax);
        auto ab = best_move(p, depth, Algorithm::AlphaBeta);
        ASSERT_EQ(mm.has_value(), ab.has_value()) << "depth " << depth;
        if (!mm) continue;
        EXPECT_EQ(ab->score, mm->score) << "depth " << depth;
        EXPECT_EQ(move_name(ab->move), move_name(mm->move)) << "depth " << depth;
        EXPECT_LE(ab->stats.nodes, mm->stats.nodes) << "depth " << depth;
        EXPECT_EQ(mm->stats.cutoffs, 0u);
    }
}

INSTANTIATE_TEST_SUITE_P(Positions, SearchAgreement, ::testing::Values(
    "rbqkbr2/pppppp2/8/8/8/8/PPPPPP2/RBQKBR2 w",
    "rbqkbr2/pppppp2/8/8/8/8/PPPPPP2/RBQKBR2 b",
    "4k3/8/8/3q4/8/8/8/3RK3 w",
    "4k3/8/8/8/8/8/8/4K3 b",
    "8/8/8/8/8/8/3k4/3RK3 w",
    "3rk3/3K4/8/8/8/8/8/8 b",
    "4k3/1p3p2/2b5/8/8/5B2/1P3P2/4K3 w",
    "kp6/pp6/pp6/pp6/pp6/pp6/pp6/pp5K b"
));

TEST(Search, AlphaBetaPrunesSomething){
    Position p = fenPos("4k3/1p3p2/2b5/8/8/5B2/1P3P2/4K3 w");
    auto mm = best_move(p, 3, Algorithm::Minimax);
    auto ab = best_move(p, 3, Algorithm::AlphaBeta);
    ASSERT_TRUE(mm.has_value());
    ASSERT_TRUE(ab.has_value());
    EXPECT_GT(ab->stats.cutoffs, 0u);
    EXPECT_LT(ab->stats.nodes, mm->stats.nodes);
}
