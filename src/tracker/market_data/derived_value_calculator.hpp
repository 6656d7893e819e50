#ifndef DERIVED_VALUE_CALCULATOR_HPP
#define DERIVED_VALUE_CALCULATOR_HPP

#include "configs/market_config.hpp"
#include "tracker/data_structures/data_structures.hpp"

namespace FtseTracker {
namespace Core {

/**
 * Maps the index price to the correlated futures contract.
 * derived_price  = round(price * coefficient)
 * derived_offset = round(derived_price - baseline)
 * Rounding is to the nearest whole point, ties to even.
 */
class DerivedValueCalculator {
public:
    explicit DerivedValueCalculator(const DerivedConfig& derived_config);

    DerivedValues calculate(double index_price) const;
    double calculate_derived_price(double index_price) const;
    double calculate_derived_offset(double derived_price) const;

private:
    double coefficient;
    double baseline;
};

} // namespace Core
} // namespace FtseTracker

#endif // DERIVED_VALUE_CALCULATOR_HPP
