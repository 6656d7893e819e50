#ifndef QUOTE_PAGES_HPP
#define QUOTE_PAGES_HPP

#include <chrono>
#include <string>

namespace QuotePages {

// Index page markup as served upstream: the value sits in a nested span
// whose class carries the direction (red up, green down).
inline std::string make_quote_page(const std::string& price_text, const std::string& price_class,
                                   const std::string& change_text, const std::string& change_class,
                                   const std::string& percent_text, const std::string& percent_class) {
    return "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>TWN</title></head><body>"
           "<div class=\"header\"><ul class=\"nav\"><li>Home</li></ul></div>"
           "<ul class=\"priceinfo mt10\">"
           "<li><span class=\"ci_title\">Price</span>"
           "<span id=\"Price1_lbTPrice\"><span class=\"" + price_class + "\">" + price_text + "</span></span></li>"
           "<li><span class=\"ci_title\">Change</span>"
           "<span id=\"Price1_lbTChange\"><span class=\"" + change_class + "\">" + change_text + "</span></span></li>"
           "<li><span class=\"ci_title\">Percent</span>"
           "<span id=\"Price1_lbTPercent\"><span class=\"" + percent_class + "\">" + percent_text + "</span></span></li>"
           "</ul></body></html>";
}

inline std::string falling_quote_page() {
    return make_quote_page("1,637.12", "clr-gr", "\xE2\x96\xBC" "68.30", "clr-gr", "-4.00%", "clr-gr");
}

inline std::string rising_quote_page() {
    return make_quote_page("1,705.90", "clr-rd", "\xE2\x96\xB2" "12.40", "clr-rd", "+0.73%", "clr-rd");
}

inline std::string page_without_price_region() {
    return "<html><body><ul class=\"nav\"><li>maintenance</li></ul></body></html>";
}

// 2024-03-06 (Wednesday) at the given Taipei (UTC+8) wall time
inline std::chrono::system_clock::time_point taipei_wednesday(int hour, int minute, int second) {
    // 2024-03-06T00:00:00Z
    const long long wednesday_midnight_utc = 1709683200LL;
    long long seconds_since_epoch = wednesday_midnight_utc + hour * 3600LL + minute * 60LL + second - 8 * 3600LL;
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds_since_epoch));
}

} // namespace QuotePages

#endif // QUOTE_PAGES_HPP
