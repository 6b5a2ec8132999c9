#pragma once

#include <memory>
#include <stdexcept>
#include <utility>

namespace WC::UI {

// Single-threaded interior-mutability cell shared between a widget handle and
// its element. Access is exclusive and non-reentrant: a mutable borrow may
// only be taken while no other borrow is alive. A violation is a programming
// error and throws std::logic_error.
template <typename T>
class SharedCell {
public:
    class BorrowMut {
    public:
        BorrowMut(BorrowMut&& other) noexcept
            : cell_(std::exchange(other.cell_, nullptr)) {}
        BorrowMut(BorrowMut const&) = delete;
        BorrowMut& operator=(BorrowMut const&) = delete;
        BorrowMut& operator=(BorrowMut&&) = delete;
        ~BorrowMut() {
            if (cell_) {
                cell_->borrow_state_ = 0;
            }
        }

        auto operator*() -> T& { return cell_->value_; }
        auto operator->() -> T* { return &cell_->value_; }

    private:
        friend class SharedCell;
        explicit BorrowMut(SharedCell* cell)
            : cell_(cell) {}

        SharedCell* cell_;
    };

    class Borrow {
    public:
        Borrow(Borrow&& other) noexcept
            : cell_(std::exchange(other.cell_, nullptr)) {}
        Borrow(Borrow const&) = delete;
        Borrow& operator=(Borrow const&) = delete;
        Borrow& operator=(Borrow&&) = delete;
        ~Borrow() {
            if (cell_) {
                --cell_->borrow_state_;
            }
        }

        auto operator*() const -> T const& { return cell_->value_; }
        auto operator->() const -> T const* { return &cell_->value_; }

    private:
        friend class SharedCell;
        explicit Borrow(SharedCell const* cell)
            : cell_(cell) {}

        SharedCell const* cell_;
    };

    template <typename... Args>
    explicit SharedCell(Args&&... args)
        : value_(std::forward<Args>(args)...) {}

    SharedCell(SharedCell const&) = delete;
    SharedCell& operator=(SharedCell const&) = delete;

    [[nodiscard]] auto borrow_mut() -> BorrowMut {
        if (borrow_state_ != 0) {
            throw std::logic_error("SharedCell: mutable borrow while already borrowed");
        }
        borrow_state_ = -1;
        return BorrowMut{this};
    }

    [[nodiscard]] auto borrow() const -> Borrow {
        if (borrow_state_ < 0) {
            throw std::logic_error("SharedCell: shared borrow while mutably borrowed");
        }
        ++borrow_state_;
        return Borrow{this};
    }

    [[nodiscard]] auto is_borrowed() const -> bool { return borrow_state_ != 0; }

private:
    T value_;
    // 0 = free, -1 = exclusively borrowed, >0 = number of shared borrows.
    mutable int borrow_state_ = 0;
};

template <typename T, typename... Args>
[[nodiscard]] auto MakeSharedCell(Args&&... args) -> std::shared_ptr<SharedCell<T>> {
    return std::make_shared<SharedCell<T>>(std::forward<Args>(args)...);
}

} // namespace WC::UI
