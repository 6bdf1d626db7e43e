#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace cryptostats {

// decimal radix, so "46813.21" is held exactly
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<50>,
    boost::multiprecision::et_off>;

using Price = Decimal;
using Symbol = std::string;
using EpochMillis = std::int64_t;

enum class QueryStatus {
    Found,
    NotFound,
    InvalidInput
};

// scales for the normalized range ratio
static constexpr unsigned REPORT_SCALE  = 3;
static constexpr unsigned RANKING_SCALE = 10;

// placeholder symbol for an empty day
static const Symbol NO_SYMBOL{};

}
