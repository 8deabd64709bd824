#ifndef ROULETTE_OMEGAEXCEPTION_HPP
#define ROULETTE_OMEGAEXCEPTION_HPP

#include <ostream>
#include <source_location>
#include <string>
#include <utility>

namespace roulette::core
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
            return std::string{src_loc_.file_name()} + "(" + std::to_string(src_loc_.line()) + ":" +
                   std::to_string(src_loc_.column()) + "), function `" + src_loc_.function_name() + "`\n";
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
    };

    template <typename T>
    auto operator<<(std::ostream& os, OmegaException<T> const& e) -> std::ostream&
    {
        return os << "Failed to process with code (" << static_cast<int>(e.data()) << "): "
                  << e.what() << "\n" << e.to_str();
    }
}

#endif //ROULETTE_OMEGAEXCEPTION_HPP
