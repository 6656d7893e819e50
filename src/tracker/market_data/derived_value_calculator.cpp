#include "derived_value_calculator.hpp"
#include <cmath>

namespace FtseTracker {
namespace Core {

DerivedValueCalculator::DerivedValueCalculator(const DerivedConfig& derived_config)
    : coefficient(derived_config.coefficient), baseline(derived_config.baseline) {}

DerivedValues DerivedValueCalculator::calculate(double index_price) const {
    DerivedValues derived_values;
    derived_values.derived_price = calculate_derived_price(index_price);
    derived_values.derived_offset = calculate_derived_offset(derived_values.derived_price);
    return derived_values;
}

double DerivedValueCalculator::calculate_derived_price(double index_price) const {
    // nearbyint under the default rounding mode rounds half to even
    return std::nearbyint(index_price * coefficient);
}

double DerivedValueCalculator::calculate_derived_offset(double derived_price) const {
    return std::nearbyint(derived_price - baseline);
}

} // namespace Core
} // namespace FtseTracker
