#undef NDEBUG
#include <cassert>
#include <iostream>
#include "../src/constraint.hpp"

const Position C1 = {0, 0};
const Position C2 = {0, 1};
const Position C3 = {0, 2};
const Position C4 = {1, 0};

void test_reduce_as_mine() {
    std::cout << "Testing reduce_as_mine...\n";
    Constraint c({C1, C2, C3}, 2);

    c.reduce_as_mine(C2);
    assert(c.get_cells() == CellSet({C1, C3}));
    assert(c.get_count() == 1);

    // not a member: no-op
    c.reduce_as_mine(C4);
    assert(c.size() == 2);
    assert(c.get_count() == 1);

    // already removed: no-op
    c.reduce_as_mine(C2);
    assert(c.size() == 2);
    assert(c.get_count() == 1);

    std::cout << "PASSED: test_reduce_as_mine\n";
}

void test_reduce_as_safe() {
    std::cout << "Testing reduce_as_safe...\n";
    Constraint c({C1, C2, C3}, 1);

    c.reduce_as_safe(C1);
    assert(c.get_cells() == CellSet({C2, C3}));
    assert(c.get_count() == 1);

    c.reduce_as_safe(C4);
    assert(c.size() == 2);

    c.reduce_as_safe(C2);
    assert(c.get_cells() == CellSet({C3}));
    assert(c.get_count() == 1);
    assert(c.known_mines() == CellSet({C3}));

    std::cout << "PASSED: test_reduce_as_safe\n";
}

void test_count_stays_in_bounds() {
    std::cout << "Testing count bounds through reductions...\n";
    Constraint c({C1, C2, C3, C4}, 2);
    auto check = [&]() {
        assert(c.get_count() >= 0);
        assert(c.get_count() <= c.size());
    };
    c.reduce_as_safe(C1); check();
    c.reduce_as_mine(C2); check();
    c.reduce_as_safe(C3); check();
    c.reduce_as_mine(C4); check();
    assert(c.empty());
    assert(c.get_count() == 0);

    std::cout << "PASSED: test_count_stays_in_bounds\n";
}

void test_known_mines() {
    assert(Constraint({C1, C2}, 2).known_mines() == CellSet({C1, C2}));
    assert(!Constraint({C1, C2}, 1).known_mines().has_value());
    assert(!Constraint({C1, C2}, 0).known_mines().has_value());
    assert(!Constraint().known_mines().has_value());

    std::cout << "PASSED: test_known_mines\n";
}

void test_known_safes() {
    assert(Constraint({C1, C2}, 0).known_safes() == CellSet({C1, C2}));
    assert(!Constraint({C1, C2}, 1).known_safes().has_value());
    // an empty constraint says nothing
    assert(!Constraint().known_safes().has_value());

    std::cout << "PASSED: test_known_safes\n";
}

void test_equality_and_ordering() {
    Constraint a({C1, C2}, 1);
    Constraint b({C2, C1}, 1);
    Constraint c({C1, C2}, 0);
    Constraint d({C1, C3}, 1);

    assert(a == b);
    assert(a != c);
    assert(a != d);
    assert(!(a < b) && !(b < a));
    assert(c < a);
    assert((a < d) != (d < a));

    std::cout << "PASSED: test_equality_and_ordering\n";
}

void test_to_string() {
    Constraint c({C2, C1}, 1);
    assert(c.to_string() == "{(0, 0), (0, 1)} = 1");
    assert(Constraint().to_string() == "{} = 0");

    std::cout << "PASSED: test_to_string\n";
}

int main() {
    test_reduce_as_mine();
    test_reduce_as_safe();
    test_count_stays_in_bounds();
    test_known_mines();
    test_known_safes();
    test_equality_and_ordering();
    test_to_string();

    std::cout << "\nAll constraint tests passed!\n";
    return 0;
}
