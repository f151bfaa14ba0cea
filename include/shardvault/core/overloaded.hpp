#pragma once

namespace shardvault {
/// Visitor built from lambdas, one per variant alternative
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}
