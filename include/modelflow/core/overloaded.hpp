#pragma once

namespace modelflow::core {

/// Builds a std::visit visitor from a set of lambdas.
template <class... Fs>
struct Overloaded : Fs... {
  using Fs::operator()...;
};

template <class... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

}  // namespace modelflow::core
