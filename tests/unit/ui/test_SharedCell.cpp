#include <widgetcore/ui/SharedCell.hpp>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <utility>

using namespace WC::UI;

TEST_SUITE("ui.shared_cell") {
    TEST_CASE("Mutable borrow writes through") {
        auto cell = MakeSharedCell<std::string>("a");
        {
            auto value = cell->borrow_mut();
            value->append("b");
            CHECK(cell->is_borrowed());
        }
        CHECK_FALSE(cell->is_borrowed());
        CHECK(*cell->borrow() == "ab");
    }

    TEST_CASE("Shared borrows may overlap") {
        auto cell = MakeSharedCell<int>(3);
        auto first = cell->borrow();
        auto second = cell->borrow();
        CHECK(*first + *second == 6);
    }

    TEST_CASE("Conflicting borrows throw") {
        auto cell = MakeSharedCell<int>(1);
        {
            auto writer = cell->borrow_mut();
            CHECK_THROWS_AS((void)cell->borrow_mut(), std::logic_error);
            CHECK_THROWS_AS((void)cell->borrow(), std::logic_error);
        }
        {
            auto reader = cell->borrow();
            CHECK_THROWS_AS((void)cell->borrow_mut(), std::logic_error);
        }
        // The cell is usable again once every guard is gone.
        *cell->borrow_mut() = 5;
        CHECK(*cell->borrow() == 5);
    }

    TEST_CASE("Moved-from guard does not release twice") {
        auto cell = MakeSharedCell<int>(0);
        {
            auto guard = cell->borrow_mut();
            auto moved = std::move(guard);
            *moved = 9;
        }
        CHECK_FALSE(cell->is_borrowed());
        CHECK(*cell->borrow() == 9);
    }
}
