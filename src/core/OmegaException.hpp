//
// Created by Malik T on 13/08/2025.
//

#ifndef SHADOWHUNT_OMEGAEXCEPTION_HPP
#define SHADOWHUNT_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace shadow::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() -> std::string& { return err_str_; }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        auto data() -> T& { return usr_data_; }
        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            return std::format("{}({}:{}), function `{}`: {}\n", src_loc_.file_name(), src_loc_.line(),
                               src_loc_.column(), src_loc_.function_name(), err_str_);
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<shadow::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(shadow::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed to process with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //SHADOWHUNT_OMEGAEXCEPTION_HPP
