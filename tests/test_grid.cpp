// Google Test for Coord, Move and Symmetry
#include <gtest/gtest.h>

#include <set>
#include <string>

#include "cellclear/grid.hpp"
#include "cellclear/marks.hpp"

using namespace cellclear;

TEST(CoordTest, RowColumnAndBounds) {
    Coord p = Coord::from(2, 3);
    EXPECT_TRUE(p.inside());
    EXPECT_EQ(p.index(), 11);
    EXPECT_EQ(p.row(), 2);
    EXPECT_EQ(p.column(), 3);

    EXPECT_FALSE(Coord::from(-1, 0).inside());
    EXPECT_FALSE(Coord::from(0, 4).inside());
    EXPECT_FALSE(Coord::from(4, 0).inside());
    EXPECT_EQ(Coord::from(0, 4), Coord::outside());
}

TEST(CoordTest, MovesStayInsideOrLeave) {
    Coord corner = Coord::from(0, 0);
    EXPECT_FALSE((corner + Move::UP).inside());
    EXPECT_FALSE((corner + Move::LEFT).inside());
    EXPECT_EQ(corner + Move::DOWN, Coord::from(1, 0));
    EXPECT_EQ(corner + Move::RIGHT, Coord::from(0, 1));

    // Leaving the grid never wraps onto the next row
    EXPECT_FALSE((Coord::from(1, 3) + Move::RIGHT).inside());
    EXPECT_FALSE((Coord::outside() + Move::LEFT).inside());
}

TEST(MoveTest, InverseAndNames) {
    EXPECT_EQ(move_inv(Move::UP), Move::DOWN);
    EXPECT_EQ(move_inv(Move::DOWN), Move::UP);
    EXPECT_EQ(move_inv(Move::LEFT), Move::RIGHT);
    EXPECT_EQ(move_inv(Move::RIGHT), Move::LEFT);

    EXPECT_STREQ(move_to_str(Move::UP), "Up");
    EXPECT_STREQ(move_to_str(Move::DOWN), "Down");
    EXPECT_STREQ(move_to_str(Move::LEFT), "Left");
    EXPECT_STREQ(move_to_str(Move::RIGHT), "Right");
}

TEST(SymmetryTest, QuarterTurnIsCounterClockwise) {
    Symmetry deg90{false, 1};
    EXPECT_EQ(Coord::from(1, 1).symmetry(deg90), Coord::from(2, 1));
    EXPECT_EQ(Coord::from(0, 0).symmetry(deg90), Coord::from(3, 0));
    EXPECT_EQ(Coord::from(1, 1).symmetry(Symmetry{false, 2}), Coord::from(2, 2));
    EXPECT_EQ(Coord::from(0, 2).symmetry(Symmetry{true, 0}), Coord::from(3, 2));
}

TEST(SymmetryTest, InverseUndoesEveryElement) {
    std::set<std::string> names;
    for (const Symmetry& sym : SYMMETRIES) {
        names.insert(sym.to_string());
        for (uint8_t i = 0; i < CELLS; ++i) {
            Coord p(i);
            EXPECT_EQ(p.symmetry(sym).symmetry(sym.inverse()), p) << sym.to_string() << " " << p.to_string();
        }
    }
    // All 8 elements are distinct
    EXPECT_EQ(names.size(), 8u);
}

TEST(SymmetryTest, MovesConjugateWithCoordinates) {
    for (const Symmetry& sym : SYMMETRIES) {
        for (uint8_t i = 0; i < CELLS; ++i) {
            Coord p(i);
            for (Move m : MOVES) {
                Coord moved = p + m;
                if (!moved.inside()) continue;
                EXPECT_EQ(p.symmetry(sym) + move_symmetry(m, sym), moved.symmetry(sym))
                    << sym.to_string() << " " << p.to_string() << " " << move_to_str(m);
            }
        }
    }
}

TEST(MarksTest, SetAndGetMarks) {
    Marks marks;
    Coord point = Coord::from(1, 1);
    EXPECT_FALSE(marks.marked(point));
    marks.mark(point);
    EXPECT_TRUE(marks.marked(point));
    marks.unmark(point);
    EXPECT_FALSE(marks.marked(point));
}

TEST(MarksTest, TransformMarks) {
    Marks marks;
    EXPECT_EQ(marks, marks.symmetry(Symmetry{false, 1}));

    marks.mark(Coord::from(1, 1));
    marks.mark(Coord::from(0, 0));
    marks.mark(Coord::from(0, 1));
    marks.mark(Coord::from(3, 3));
    marks.mark(Coord::from(2, 3));
    marks.mark(Coord::from(3, 2));

    Marks rot90 = marks.symmetry(Symmetry{false, 1});
    EXPECT_NE(marks, rot90) << marks.to_string() << rot90.to_string();
    EXPECT_FALSE(marks.marked(Coord::from(2, 1)));
    EXPECT_TRUE(rot90.marked(Coord::from(2, 1)));

    EXPECT_TRUE(marks.symmetry(Symmetry{false, 2}).marked(Coord::from(2, 2)));
    EXPECT_EQ(marks, marks.symmetry(Symmetry{false, 3}).symmetry(Symmetry{false, 1}));
    EXPECT_EQ(marks, marks.symmetry(Symmetry{true, 0}).symmetry(Symmetry{true, 0}));
}

TEST(MarksTest, RowAndColumnBits) {
    Marks marks;
    marks.mark(Coord::from(1, 0));
    marks.mark(Coord::from(1, 2));
    marks.mark(Coord::from(3, 2));

    EXPECT_EQ(marks.row_bits(0), 0);
    EXPECT_EQ(marks.row_bits(1), (1 << 4) | (1 << 6));
    EXPECT_EQ(marks.column_bits(2), (1 << 6) | (1 << 14));
    EXPECT_EQ(marks.column_bits(3), 0);
}
