/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_UTIL_OVERLOADED_HH
#define LOCUS_GUARD_UTIL_OVERLOADED_HH

#include <utility>
#include <variant>

namespace locus
{
    template <class... Ts_>
    struct overloaded : Ts_...
    {
        using Ts_::operator()...;

        // Lets us write overloaded{ ... }.visit(space) when the lambdas
        // are long, rather than burying the variant at the end of the call.
        template <typename... Args_>
        auto visit(Args_ &&... a) -> decltype(auto)
        {
            return std::visit(*this, std::forward<Args_>(a)...);
        }
    };

    template <class... Ts_>
    overloaded(Ts_...) -> overloaded<Ts_...>;
}

#endif
