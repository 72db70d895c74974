#pragma once

namespace pdrop {
// visitor built from lambdas, one per variant alternative
template <class... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
} // namespace pdrop
