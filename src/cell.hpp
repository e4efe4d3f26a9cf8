#ifndef CELL_HPP
#define CELL_HPP

#include "value.hpp"
#include <memory>

namespace funcobj {

// Single-slot box used for captured variables. Every closure holding the same
// Cell sees the same slot; an empty cell holds nullptr.
class Cell : public Object {
private:
    Ref contents_;

public:
    Cell() = default;
    explicit Cell(Ref contents) : contents_(std::move(contents)) {}

    const Ref& get() const { return contents_; }
    void set(Ref contents) { contents_ = std::move(contents); }
    bool empty() const { return contents_ == nullptr; }

    TypeRef type() const override;
    std::string repr() const override;
};

using CellRef = std::shared_ptr<Cell>;

const TypeRef& cell_type();

inline CellRef make_cell(Ref contents = nullptr) {
    return std::make_shared<Cell>(std::move(contents));
}

} // namespace funcobj

#endif // CELL_HPP
