#pragma once
#include <array>
#include <cstddef>
#include "parlor/square.hpp"


namespace parlor {


// Destination squares reachable from one origin. A queen in the centre of an
// empty board reaches 27 squares, so 32 is always enough.
struct SquareList {
static constexpr std::size_t CAP = 32;
std::array<Square, CAP> data{};
std::size_t sz = 0;


void push(const Square& s) { if (sz < CAP) data[sz++] = s; }
const Square* begin() const { return data.data(); }
const Square* end() const { return data.data() + sz; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }


bool contains(const Square& s) const {
for (const auto& t : *this) if (t == s) return true;
return false;
}
};


} // namespace parlor
