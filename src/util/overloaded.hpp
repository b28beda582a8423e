#pragma once

/// @file overloaded.hpp
/// @brief Builds a std::visit visitor from a set of lambdas

namespace tachy {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace tachy
