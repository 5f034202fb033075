#pragma once

#include <string>
#include <utility>
#include <variant>

namespace EcoSim {

/**
 * Value-or-error return type used at I/O boundaries (config files, history
 * database, telemetry output). The engine itself throws on bad input instead.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& s);
 *   auto r = parse("42");
 *   if (r.isError()) { SLOG_WARN("{}", r.errorValue()); }
 */
template <typename T, typename E = std::string>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace EcoSim
