#ifndef PRICE_QUANTIZER_HPP
#define PRICE_QUANTIZER_HPP

namespace FtseTracker {
namespace Core {

// Rounds to the nearest quarter point:
// [0,.125)->.0  [.125,.375)->.25  [.375,.625)->.5  [.625,.875)->.75  [.875,1)->next integer
// Non-finite input is returned unchanged.
double round_to_quarter(double raw_price);

} // namespace Core
} // namespace FtseTracker

#endif // PRICE_QUANTIZER_HPP
