#pragma once

namespace ftr::aux
{
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace ftr::aux
