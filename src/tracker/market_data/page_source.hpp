#ifndef PAGE_SOURCE_HPP
#define PAGE_SOURCE_HPP

#include <memory>
#include <string>

namespace FtseTracker {
namespace Core {

// Supplies the raw index page. Implementations throw NetworkError when the
// page cannot be obtained.
class PageSource {
public:
    virtual ~PageSource() = default;
    virtual std::string fetch_page() = 0;
};

using PageSourcePtr = std::unique_ptr<PageSource>;

} // namespace Core
} // namespace FtseTracker

#endif // PAGE_SOURCE_HPP
