#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace vstream::html {

// Single `bytes=<start>-[end]` ranges only; suffix and multi-range forms are malformed.
class http_range
{
public:
    enum class kind
    {
        none,
        bytes,
        malformed
    };

public:
    http_range() = default;

    static http_range parse(std::optional<std::string_view> header_value);

    kind type() const { return kind_; }
    bool is_none() const { return kind_ == kind::none; }
    bool is_malformed() const { return kind_ == kind::malformed; }

    std::uint64_t start() const { return start_; }

    const std::optional<std::uint64_t>& end() const { return end_; }

private:
    static http_range malformed();

    kind kind_ = kind::none;
    std::uint64_t start_ = 0;
    std::optional<std::uint64_t> end_;
};

} // namespace vstream::html
