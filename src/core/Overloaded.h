#pragma once

namespace vin {

// Visitor built from lambdas, for std::visit
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // ns
