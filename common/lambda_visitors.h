#pragma once

/// @brief Builds overload set out of lambdas to be used with std::visit.
/// Usage:
///   const LambdaVisitor visitor{[](const A &) {}, [](const auto &) {}};
///   std::visit(visitor, variant);
template <typename... taLambdas>
struct LambdaVisitor : taLambdas...
{
    using taLambdas::operator()...;
};

template <typename... taLambdas>
LambdaVisitor(taLambdas...) -> LambdaVisitor<taLambdas...>;
